// test_artifact_store.cpp - Blob store backends and digest sidecars

#include <gtest/gtest.h>

#include "fris/core/Errors.hpp"
#include "fris/store/ArtifactStore.hpp"
#include "fris/store/Digest.hpp"

#include <filesystem>
#include <fstream>

using namespace fris;

TEST(DigestTest, KnownSha256Vectors) {
    EXPECT_EQ(Digest::sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Digest::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, PrefixIsFirstEightBytesBigEndian) {
    EXPECT_EQ(Digest::sha256Prefix64("abc"), 0xba7816bf8f01cfeaULL);
}

TEST(MemoryArtifactStoreTest, PutGetAndMissingKey) {
    MemoryArtifactStore store;
    store.put("v1/a.json", "{}");
    EXPECT_TRUE(store.contains("v1/a.json"));
    EXPECT_TRUE(store.contains("v1/a.json.sha256"));
    EXPECT_EQ(store.get("v1/a.json"), "{}");
    EXPECT_THROW(store.get("v1/b.json"), ArtifactError);
}

TEST(MemoryArtifactStoreTest, DigestMismatchIsArtifactError) {
    MemoryArtifactStore store;
    store.put("v1/a.json", "{\"x\": 1}");
    store.putRaw("v1/a.json", "{\"x\": 2}");
    EXPECT_THROW(store.get("v1/a.json"), ArtifactError);
}

TEST(MemoryArtifactStoreTest, BlobWithoutSidecarIsReadAsIs) {
    MemoryArtifactStore store;
    store.putRaw("v1/raw.json", "payload");
    EXPECT_EQ(store.get("v1/raw.json"), "payload");
}

TEST(FileArtifactStoreTest, RoundTripsThroughDisk) {
    const auto root = std::filesystem::temp_directory_path() / "fris_store_test";
    std::filesystem::remove_all(root);

    FileArtifactStore store(root.string());
    store.put("v2/models/kmeans.json", "{\"centroids\": [[0]]}");
    EXPECT_TRUE(std::filesystem::exists(root / "v2" / "models" / "kmeans.json.sha256"));
    EXPECT_EQ(store.get("v2/models/kmeans.json"), "{\"centroids\": [[0]]}");

    {
        std::ofstream tamper(root / "v2" / "models" / "kmeans.json", std::ios::trunc);
        tamper << "{\"centroids\": [[1]]}";
    }
    EXPECT_THROW(store.get("v2/models/kmeans.json"), ArtifactError);

    std::filesystem::remove_all(root);
}

TEST(FileArtifactStoreTest, RejectsEscapingKeys) {
    FileArtifactStore store("/tmp/fris_unused");
    EXPECT_THROW(store.get("../etc/passwd"), ArtifactError);
    EXPECT_THROW(store.get("/abs"), ArtifactError);
    EXPECT_THROW(store.get(""), ArtifactError);
}
