#include "chat/StorageMover.h"

#include <fstream>
#include <iostream>
#include <utility>

namespace recallchat::chat {

namespace fs = std::filesystem;

StorageMover::StorageMover(fs::path root)
    : root_(std::move(root)),
      public_dir_(root_ / "public"),
      vault_dir_(root_ / "vault") {}

void StorageMover::prepare() const {
    fs::create_directories(public_dir_);
    fs::create_directories(vault_dir_);
}

std::optional<std::string> StorageMover::store(const std::string& stored_name,
                                               std::string_view bytes,
                                               Location where,
                                               std::error_code& ec) const {
    const fs::path target = (where == Location::Vault ? vault_dir_ : public_dir_) / stored_name;

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        ec = std::make_error_code(std::errc::io_error);
        std::error_code ignored;
        fs::remove(target, ignored);
        return std::nullopt;
    }

    ec.clear();
    return target.string();
}

MoveOutcome StorageMover::move_to_restricted(Artifact& artifact) const {
    if (!artifact.public_path) return MoveOutcome::AlreadyRestricted;

    const fs::path from = *artifact.public_path;
    const fs::path to = vault_dir_ / artifact.stored_name;

    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        artifact.public_path.reset();
        artifact.restricted_path = to.string();
        return MoveOutcome::Moved;
    }

    std::cerr << "[Storage] move " << artifact.id << " to vault failed: " << ec.message()
              << "; deleting\n";

    std::error_code rm_ec;
    fs::remove(from, rm_ec);
    if (rm_ec) {
        std::cerr << "[Storage] delete " << artifact.id << " failed: " << rm_ec.message() << "\n";
    }
    artifact.public_path.reset();
    artifact.restricted_path.reset();
    return MoveOutcome::Deleted;
}

std::string StorageMover::sanitize_file_name(std::string name) {
    // Only the last path component survives.
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) name = name.substr(slash + 1);

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) continue;
        if (c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|') {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    while (!out.empty() && (out.front() == '.' || out.front() == ' ')) out.erase(out.begin());
    if (out.size() > kMaxNameLen) out.resize(kMaxNameLen);
    if (out.empty()) out = "file";
    return out;
}

std::string StorageMover::stored_name_for(const std::string& id, const std::string& original) {
    return id + "-" + sanitize_file_name(original);
}

} // namespace recallchat::chat
