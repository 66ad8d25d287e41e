#include "fris/store/ArtifactStore.hpp"
#include "fris/store/Digest.hpp"
#include "fris/core/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace fris {

std::string ArtifactStore::get(const std::string& key) const {
    std::optional<std::string> blob = read(key);
    if (!blob) {
        throw ArtifactError("blob not found: " + key + " (" + describe() + ")");
    }

    const std::string digest_key = key + DIGEST_SUFFIX;
    if (exists(digest_key)) {
        std::optional<std::string> expected = read(digest_key);
        std::string want = expected ? *expected : "";
        while (!want.empty() && (want.back() == '\n' || want.back() == '\r' || want.back() == ' ')) {
            want.pop_back();
        }
        const std::string got = Digest::sha256Hex(*blob);
        if (want != got) {
            throw ArtifactError("digest mismatch for " + key + ": expected " + want + ", got " + got);
        }
    }
    return *blob;
}

void ArtifactStore::put(const std::string& key, const std::string& bytes) {
    write(key, bytes);
    write(key + DIGEST_SUFFIX, Digest::sha256Hex(bytes) + "\n");
}

void ArtifactStore::putRaw(const std::string& key, const std::string& bytes) {
    write(key, bytes);
}

// -----------------------------------------------------------------------------
// FileArtifactStore
// -----------------------------------------------------------------------------
FileArtifactStore::FileArtifactStore(std::string root) : root_(std::move(root)) {}

std::string FileArtifactStore::pathFor(const std::string& key) const {
    if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
        throw ArtifactError("invalid artifact key: '" + key + "'");
    }
    return (fs::path(root_) / key).string();
}

std::optional<std::string> FileArtifactStore::read(const std::string& key) const {
    std::ifstream in(pathFor(key), std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ArtifactError("read failed: " + pathFor(key));
    }
    return data;
}

void FileArtifactStore::write(const std::string& key, const std::string& bytes) {
    const fs::path path(pathFor(key));
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw ArtifactError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw ArtifactError("cannot open for write: " + path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw ArtifactError("write failed: " + path.string());
    }
}

bool FileArtifactStore::exists(const std::string& key) const {
    std::error_code ec;
    return fs::is_regular_file(pathFor(key), ec);
}

// -----------------------------------------------------------------------------
// MemoryArtifactStore
// -----------------------------------------------------------------------------
std::optional<std::string> MemoryArtifactStore::read(const std::string& key) const {
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return it->second;
}

void MemoryArtifactStore::write(const std::string& key, const std::string& bytes) {
    blobs_[key] = bytes;
}

bool MemoryArtifactStore::exists(const std::string& key) const {
    return blobs_.count(key) > 0;
}

} // namespace fris
