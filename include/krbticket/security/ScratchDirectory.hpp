#ifndef INCLUDE_KRBTICKET_SECURITY_SCRATCHDIRECTORY_HPP
#define INCLUDE_KRBTICKET_SECURITY_SCRATCHDIRECTORY_HPP

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

namespace krbticket::security
{

// Owner-only (0700) directory with an unpredictable name under the OS temp dir.
// The directory and everything inside it is removed when the guard is destroyed.
class [[nodiscard]] ScratchDirectory final
{
public:
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&&) = delete;
    ~ScratchDirectory() noexcept;

    // Returns std::nullopt when no private directory could be created.
    [[nodiscard]] static std::optional<ScratchDirectory> create(std::string_view suffix,
                                                                const std::filesystem::path& root = {});

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_path;
    }

private:
    explicit ScratchDirectory(std::filesystem::path p) noexcept : m_path{ std::move(p) }
    {
    }

    std::filesystem::path m_path;
};

} // namespace krbticket::security

#endif // INCLUDE_KRBTICKET_SECURITY_SCRATCHDIRECTORY_HPP
