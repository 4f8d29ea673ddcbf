#include <durasync/transport.hpp>
#include <durasync/cursor.hpp>

namespace durasync
{
    std::string StreamScope::key() const
    {
        return make_scope(owner, peer);
    }

    std::string UploadSignature::fingerprint() const
    {
        // name and type may contain anything; the numeric fields are last
        std::string out;
        out.reserve(filename.size() + mimeType.size() + 48);
        out += filename;
        out += '\x1f';
        out += mimeType;
        out += '\x1f';
        out += std::to_string(totalBytes);
        out += '\x1f';
        out += std::to_string(lastWrite);
        return out;
    }

} // namespace durasync
