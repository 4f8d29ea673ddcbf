#include <durasync/cursor.hpp>

#include <utility>

namespace durasync
{
    std::string make_scope(const std::string &owner, const std::string &peer)
    {
        if (peer.empty())
            return "global:" + owner;
        return "peer:" + owner + ":" + peer;
    }

    Cursor::Cursor(std::string scope, std::uint64_t initial)
        : scope_(std::move(scope)),
          last_(initial)
    {
    }

    std::uint64_t Cursor::last() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    std::string Cursor::version_tag() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return versionTag_;
    }

    bool Cursor::advanced() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return advanced_;
    }

    bool Cursor::advance(std::uint64_t newOffset)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (newOffset <= last_)
            return false;
        last_ = newOffset;
        advanced_ = true;
        return true;
    }

    void Cursor::reset(std::uint64_t offset)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = offset;
    }

    void Cursor::set_version_tag(std::string tag)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        versionTag_ = std::move(tag);
    }

} // namespace durasync
