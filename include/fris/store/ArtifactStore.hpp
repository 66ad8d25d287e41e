// =============================================================================
// ArtifactStore.hpp - Versioned blob store for frozen artifacts
// =============================================================================
// PURPOSE: The only I/O the scoring core performs, once, at startup.
// DESIGN:
//   - Keys are "<model_version>/<name>" (e.g. "2024.01/artifacts.json")
//   - put() writes the blob plus a "<key>.sha256" sidecar
//   - get() verifies the sidecar when present; mismatch is an ArtifactError
//   - Backends: directory on disk, or in-memory (tests, embedding)
// =============================================================================
#pragma once

#include <map>
#include <optional>
#include <string>

namespace fris {

class ArtifactStore {
public:
    static constexpr const char* DIGEST_SUFFIX = ".sha256";

    virtual ~ArtifactStore() = default;

    // Blob contents; ArtifactError when absent or when the digest disagrees.
    std::string get(const std::string& key) const;

    // Writes blob and digest sidecar.
    void put(const std::string& key, const std::string& bytes);

    // Writes the blob only, leaving any existing sidecar untouched.
    void putRaw(const std::string& key, const std::string& bytes);

    bool contains(const std::string& key) const { return exists(key); }

    virtual std::string describe() const = 0;

protected:
    virtual std::optional<std::string> read(const std::string& key) const = 0;
    virtual void write(const std::string& key, const std::string& bytes) = 0;
    virtual bool exists(const std::string& key) const = 0;
};

// =============================================================================
// Directory-backed store: key maps to <root>/<key>
// =============================================================================
class FileArtifactStore : public ArtifactStore {
public:
    explicit FileArtifactStore(std::string root);

    const std::string& root() const { return root_; }
    std::string describe() const override { return "file:" + root_; }

protected:
    std::optional<std::string> read(const std::string& key) const override;
    void write(const std::string& key, const std::string& bytes) override;
    bool exists(const std::string& key) const override;

private:
    std::string pathFor(const std::string& key) const;

    std::string root_;
};

class MemoryArtifactStore : public ArtifactStore {
public:
    std::string describe() const override { return "memory"; }

protected:
    std::optional<std::string> read(const std::string& key) const override;
    void write(const std::string& key, const std::string& bytes) override;
    bool exists(const std::string& key) const override;

private:
    std::map<std::string, std::string> blobs_;
};

} // namespace fris
