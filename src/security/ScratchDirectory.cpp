#include "krbticket/security/ScratchDirectory.hpp"

#include "krbticket/security/SecureRandom.hpp"
#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>

namespace krbticket::security
{
namespace
{

constexpr std::size_t g_kTokenBytes{ 16U };
constexpr std::size_t g_kMaxAttempts{ 16U };
constexpr std::string_view g_kNamePrefix{ "krbticket_" };

[[nodiscard]] std::filesystem::path tempRoot() noexcept
{
    std::error_code ec{};
    auto root{ std::filesystem::temp_directory_path(ec) };
    if (ec)
    {
        return {};
    }
    return root;
}

[[nodiscard]] bool isOwnerOnly(const std::filesystem::path& dir) noexcept
{
    std::error_code ec{};
    const auto perms{ std::filesystem::status(dir, ec).permissions() };
    if (ec)
    {
        return false;
    }
    const auto publicBits{ std::filesystem::perms::group_all | std::filesystem::perms::others_all };
    return (perms & publicBits) == std::filesystem::perms::none;
}

} // namespace

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept : m_path{ std::move(other.m_path) }
{
    other.m_path.clear();
}

ScratchDirectory::~ScratchDirectory() noexcept
{
    if (m_path.empty())
    {
        return;
    }
    std::error_code ec{};
    std::filesystem::remove_all(m_path, ec);
}

std::optional<ScratchDirectory> ScratchDirectory::create(std::string_view suffix, const std::filesystem::path& root)
{
    const std::filesystem::path base{ root.empty() ? tempRoot() : root };
    if (base.empty())
    {
        return std::nullopt;
    }

    for (std::size_t attempt{}; attempt < g_kMaxAttempts; ++attempt)
    {
        const std::string token{ secureRandomHexToken(g_kTokenBytes) };
        if (token.empty())
        {
            break;
        }

        std::string name{ g_kNamePrefix };
        name += token;
        name += suffix;
        const std::filesystem::path dir{ base / std::filesystem::path{ name } };

        // Created owner-only in one step; mkdir fails on an existing entry, so a pre-planted path
        // is never reused. The umask can only narrow the mode further.
        if (::mkdir(dir.c_str(), S_IRWXU) != 0)
        {
            if (errno == EEXIST || errno == EINTR)
            {
                continue;
            }
            break;
        }

        // A restrictive umask may have stripped owner bits; restore them without widening.
        ScratchDirectory guard{ dir };
        std::error_code ec{};
        std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace,
                                     ec);
        if (ec || !isOwnerOnly(dir))
        {
            continue;
        }
        return std::optional<ScratchDirectory>{ std::move(guard) };
    }

    return std::nullopt;
}

} // namespace krbticket::security
