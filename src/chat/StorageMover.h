#pragma once

#include "chat/Artifact.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace recallchat::chat {

enum class Location { Public, Vault };

enum class MoveOutcome {
    AlreadyRestricted,
    Moved,
    Deleted,  // rename failed; file removed, both paths cleared
};

// Owns the on-disk layout: <root>/public holds servable files, <root>/vault
// holds files reachable only through identity-gated endpoints.
class StorageMover {
public:
    static constexpr std::size_t kMaxNameLen = 120;

    explicit StorageMover(std::filesystem::path root);

    // Creates both directories. Throws std::filesystem::filesystem_error.
    void prepare() const;

    // Writes bytes under the given location and returns the full path.
    std::optional<std::string> store(const std::string& stored_name,
                                     std::string_view bytes,
                                     Location where,
                                     std::error_code& ec) const;

    // Call with the artifact's registry lock held.
    MoveOutcome move_to_restricted(Artifact& artifact) const;

    static std::string stored_name_for(const std::string& id, const std::string& original);
    static std::string sanitize_file_name(std::string name);

    const std::filesystem::path& public_dir() const noexcept { return public_dir_; }
    const std::filesystem::path& vault_dir() const noexcept { return vault_dir_; }

private:
    std::filesystem::path root_;
    std::filesystem::path public_dir_;
    std::filesystem::path vault_dir_;
};

} // namespace recallchat::chat
