#include "krbticket/core/EnvConfig.hpp"
#include "krbticket/core/KrbErrors.hpp"
#include "krbticket/core/Logging.hpp"
#include "krbticket/core/SessionConfig.hpp"
#include "krbticket/core/TicketSession.hpp"
#include "krbticket/gss/mit/MitGssApiFactory.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace
{

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitFailed{ 1 };
constexpr int g_kExitUsage{ 2 };

struct CliOptions final
{
    krbticket::core::ConfigOverrides overrides;
    std::vector<std::string> positional;
};

void printUsage(std::ostream& out)
{
    out << "usage: krbticket [--principal NAME] [--ccache CACHE] [--keytab PATH] [--log-level LEVEL] <command>\n"
           "commands:\n"
           "  status          report whether the cached TGT is expired\n"
           "  default         check credentials already present in the cache\n"
           "  keytab [PATH]   acquire a TGT with a key table\n"
           "environment: KTC_PRINCIPAL, KTC_CCACHE, KTC_KEYTAB, KTC_LOG_LEVEL\n";
}

[[nodiscard]] CliOptions parseArgs(const std::vector<std::string_view>& args)
{
    CliOptions out{};
    for (std::size_t i{}; i < args.size(); ++i)
    {
        const std::string_view arg{ args[i] };
        const auto takeValue = [&]() -> std::string {
            if (i + 1U >= args.size())
            {
                throw std::invalid_argument(std::string{ arg } + " requires a value");
            }
            ++i;
            return std::string{ args[i] };
        };

        if (arg == "--principal")
        {
            out.overrides.principal = takeValue();
        }
        else if (arg == "--ccache")
        {
            out.overrides.ccache = takeValue();
        }
        else if (arg == "--keytab")
        {
            out.overrides.keytab = takeValue();
        }
        else if (arg == "--log-level")
        {
            const std::string level{ takeValue() };
            if (!krbticket::core::setLogLevel(level))
            {
                throw std::invalid_argument("unknown log level '" + level + "'");
            }
        }
        else if (arg.starts_with("--"))
        {
            throw std::invalid_argument("unknown option " + std::string{ arg });
        }
        else
        {
            out.positional.emplace_back(arg);
        }
    }
    return out;
}

[[nodiscard]] int runStatus(krbticket::core::TicketSession& session)
{
    if (session.isExpired())
    {
        std::cout << session.config().principal().name() << ": expired\n";
        return g_kExitFailed;
    }

    std::cout << session.config().principal().name() << ": valid";
    if (const auto expiry{ session.lifetime().expiryString() })
    {
        std::cout << " until " << *expiry;
    }
    std::cout << "\n";
    return g_kExitOk;
}

[[nodiscard]] int runKeytab(krbticket::core::TicketSession& session, const CliOptions& opts)
{
    std::filesystem::path keytab{};
    if (opts.positional.size() > 1U)
    {
        keytab = opts.positional[1];
    }
    else if (session.config().keytab().has_value())
    {
        keytab = *session.config().keytab();
    }
    else
    {
        throw std::invalid_argument("no key table: pass a path, --keytab or set KTC_KEYTAB");
    }

    const auto res{ session.tryAcquireWithKeyTab(keytab) };
    if (const auto* error{ std::get_if<krbticket::core::AcquireError>(&res) })
    {
        std::cerr << "keytab acquisition failed: " << krbticket::core::toString(*error) << "\n";
        return g_kExitFailed;
    }
    std::cout << "acquired TGT for " << session.config().principal().name() << "\n";
    return g_kExitOk;
}

} // namespace

int main(int argc, char** argv)
{
    krbticket::core::configureLoggingFromEnv();

    try
    {
        const std::vector<std::string_view> args(argv + 1, argv + argc);
        const CliOptions opts{ parseArgs(args) };
        if (opts.positional.empty())
        {
            printUsage(std::cerr);
            return g_kExitUsage;
        }

        auto gss{ krbticket::gss::mit::makeMitGssApi() };
        krbticket::core::TicketSession session{ *gss,
                                                krbticket::core::loadSessionConfigFromEnv(*gss, opts.overrides) };

        const std::string_view command{ opts.positional.front() };
        if (command == "status")
        {
            return runStatus(session);
        }
        if (command == "default")
        {
            const auto res{ session.tryAcquireFromDefault() };
            if (const auto* error{ std::get_if<krbticket::core::AcquireError>(&res) })
            {
                std::cerr << "no usable credentials: " << krbticket::core::toString(*error) << "\n";
                return g_kExitFailed;
            }
            std::cout << "credentials present for " << session.config().principal().name() << "\n";
            return g_kExitOk;
        }
        if (command == "keytab")
        {
            return runKeytab(session, opts);
        }

        printUsage(std::cerr);
        return g_kExitUsage;
    }
    catch (const krbticket::core::InvalidPrincipalError& e)
    {
        std::cerr << "error: " << e.what() << '\n';
        return g_kExitUsage;
    }
    catch (const krbticket::core::KeytabNotFoundError& e)
    {
        std::cerr << "error: " << e.what() << '\n';
        return g_kExitUsage;
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "error: " << e.what() << '\n';
        printUsage(std::cerr);
        return g_kExitUsage;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return g_kExitFailed;
    }
}
