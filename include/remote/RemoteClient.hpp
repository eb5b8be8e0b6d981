#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ferry::remote {

struct RemoteEntry {
    std::uint64_t fs_id{};
    std::string server_filename;
    std::string path;
    bool is_dir{false};
};

// Narrow view of the remote storage protocol client. Implementations own
// the session and are not expected to be thread safe; callers serialize
// every call through the shared ExecutionLock.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    virtual bool authenticate(const std::string& sessionToken) = 0;

    // Saves a shared resource into destPath. Returns a service result code, 0 on success.
    virtual int transfer(const std::string& baseUrl, const std::string& code, const std::string& destPath) = 0;

    // Returns the new share link, or a service result code.
    virtual std::variant<std::string, int> createShare(std::uint64_t fsId,
                                                       unsigned int expiryDays,
                                                       const std::string& password) = 0;

    virtual std::variant<std::vector<RemoteEntry>, int> listDirectory(const std::string& path) = 0;

    // Best effort lookups run before a transfer.
    virtual bool verifyAccessCode(const std::string&, const std::string&) { return true; }
    virtual std::optional<std::string> resolveShareFilename(const std::string&) { return std::nullopt; }
};

} // namespace ferry::remote
