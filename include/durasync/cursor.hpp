#ifndef DURASYNC_CURSOR_HPP
#define DURASYNC_CURSOR_HPP

/**
 * @file cursor.hpp
 * @brief Offset ledger: last synchronized offset of one stream scope.
 *
 * Writers from the push path and from range reads serialize on an internal
 * mutex, so a lower offset can never overwrite a higher one.
 */

#include <cstdint>
#include <mutex>
#include <string>

namespace durasync
{
    /// "global:<owner>" or "peer:<owner>:<peer>".
    std::string make_scope(const std::string &owner, const std::string &peer = {});

    class Cursor
    {
    public:
        explicit Cursor(std::string scope, std::uint64_t initial = 0);

        Cursor(const Cursor &) = delete;
        Cursor &operator=(const Cursor &) = delete;

        const std::string &scope() const noexcept { return scope_; }

        std::uint64_t last() const;
        std::string version_tag() const;

        /// True once advance() accepted at least one offset.
        bool advanced() const;

        /// Move forward; false (and no change) when newOffset <= current.
        bool advance(std::uint64_t newOffset);

        /// Forced repositioning, used to seed a fresh stream.
        void reset(std::uint64_t offset);

        void set_version_tag(std::string tag);

    private:
        const std::string scope_;
        mutable std::mutex mutex_;
        std::uint64_t last_{0};
        std::string versionTag_;
        bool advanced_{false};
    };

} // namespace durasync

#endif // DURASYNC_CURSOR_HPP
