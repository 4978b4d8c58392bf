#pragma once

#include <filesystem>
#include <optional>

/**
 * File-backed cookie storage for one link.
 *
 * The file is created empty (or seeded from the global cookie file) and
 * removed when the jar is destroyed, whatever way the link ends.
 * Move-only: one jar, one link.
 */
class CookieJar
{
public:
    /**
     * Create a fresh jar in directory.
     *
     * @param seed Global cookie file copied in if it exists and is non-empty
     * @param directory Where the jar file lives (system temp dir by default)
     * @throws std::runtime_error if the file cannot be created
     */
    static CookieJar create(const std::optional<std::filesystem::path> &seed,
                            const std::filesystem::path &directory = std::filesystem::temp_directory_path());

    ~CookieJar();

    CookieJar(const CookieJar &) = delete;
    CookieJar &operator=(const CookieJar &) = delete;

    CookieJar(CookieJar &&other) noexcept;
    CookieJar &operator=(CookieJar &&other) noexcept;

    const std::filesystem::path &path() const { return path_; }

    /**
     * Copy the current cookies to a new, uniquely named file next to the
     * jar. The copy outlives the jar.
     *
     * @return Path of the copy
     * @throws std::runtime_error if the file cannot be created
     * @throws std::filesystem::filesystem_error on copy failure
     */
    std::filesystem::path keepCopy() const;

private:
    explicit CookieJar(std::filesystem::path path);
    void release() noexcept;

    std::filesystem::path path_;
};
