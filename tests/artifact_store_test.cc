#include "carvenet/artifact_store.h"

#include "synthetic_jpeg.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace carvenet {
namespace {

    static Artifact make_artifact(uint64_t offset, uint32_t seed,
                                  bool with_fingerprint)
    {
        Artifact a;
        a.absolute_start = offset;
        a.payload        = test_support::make_jpeg(256, seed);
        if (with_fingerprint) {
            a.has_fingerprint = compute_fingerprint(a.payload, &a.fingerprint);
        }
        return a;
    }


    static std::string fresh_dir(const char* name)
    {
        const std::string dir = ::testing::TempDir() + name;
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        return dir;
    }


    static size_t count_files(const std::string& dir)
    {
        size_t n = 0;
        std::error_code ec;
        for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
            if (e.is_regular_file()) {
                n += 1U;
            }
        }
        return n;
    }

}  // namespace


TEST(ArtifactStore, AdmitsSamePayloadOnce)
{
    MemorySink sink;
    ArtifactStore store(&sink);

    const Artifact a = make_artifact(4096, 1, true);
    const AdmitResult first = store.admit(a);
    EXPECT_EQ(first.status, AdmitStatus::Accepted);
    EXPECT_EQ(first.name,
              "recovered_4096_" + fingerprint_hex(a.fingerprint).substr(0, 16)
                  + ".jpg");

    // Same bytes seen at another offset (e.g. a copy elsewhere on disk).
    Artifact copy       = a;
    copy.absolute_start = 9000;
    const AdmitResult second = store.admit(copy);
    EXPECT_EQ(second.status, AdmitStatus::Duplicate);
    EXPECT_TRUE(second.name.empty());

    EXPECT_EQ(store.accepted_count(), 1U);
    EXPECT_EQ(store.duplicate_count(), 1U);
    EXPECT_EQ(store.accepted_bytes(), a.payload.size());
    ASSERT_EQ(sink.size(), 1U);
    EXPECT_EQ(sink.entries()[0].payload, a.payload);

    const std::vector<StoredArtifact> records = store.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].absolute_start, 4096U);
    EXPECT_EQ(records[0].size, a.payload.size());
    EXPECT_TRUE(store.contains(a.fingerprint));
}


TEST(ArtifactStore, ComputesMissingFingerprint)
{
    MemorySink sink;
    ArtifactStore store(&sink);

    const Artifact plain = make_artifact(0, 2, false);
    EXPECT_EQ(store.admit(plain).status, AdmitStatus::Accepted);
    EXPECT_EQ(store.admit(make_artifact(10, 2, true)).status,
              AdmitStatus::Duplicate);
    EXPECT_EQ(store.admit(make_artifact(10, 3, true)).status,
              AdmitStatus::Accepted);
    EXPECT_EQ(sink.size(), 2U);
}


TEST(ArtifactStore, FailedPersistIsNotRecorded)
{
    MemorySink sink;
    ArtifactStore store(&sink);
    const Artifact a = make_artifact(0, 4, true);

    sink.set_fail(true);
    EXPECT_EQ(store.admit(a).status, AdmitStatus::PersistFailed);
    EXPECT_FALSE(store.contains(a.fingerprint));
    EXPECT_EQ(store.failed_count(), 1U);

    sink.set_fail(false);
    EXPECT_EQ(store.admit(a).status, AdmitStatus::Accepted);
    EXPECT_EQ(store.accepted_count(), 1U);

    ArtifactStore no_sink(nullptr);
    EXPECT_EQ(no_sink.admit(a).status, AdmitStatus::PersistFailed);
}


TEST(ArtifactStore, ConcurrentAdmitsPersistEachPayloadOnce)
{
    MemorySink sink;
    ArtifactStore store(&sink);

    std::vector<Artifact> artifacts;
    for (uint32_t i = 0; i < 8U; ++i) {
        artifacts.push_back(make_artifact(i * 1000U, i, true));
    }

    std::vector<std::thread> threads;
    for (uint32_t t = 0; t < 4U; ++t) {
        threads.emplace_back([&store, &artifacts] {
            for (const Artifact& a : artifacts) {
                const AdmitResult r = store.admit(a);
                EXPECT_NE(r.status, AdmitStatus::PersistFailed);
            }
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }
    EXPECT_EQ(store.accepted_count(), 8U);
    EXPECT_EQ(store.duplicate_count(), 24U);
    EXPECT_EQ(sink.size(), 8U);
}


TEST(ArtifactStore, DirectorySinkWritesFiles)
{
    const std::string dir = fresh_dir("carvenet_store_out");
    DirectorySink sink(dir + "/nested");
    ASSERT_TRUE(sink.prepare());

    ArtifactStore store(&sink);
    const Artifact a = make_artifact(512, 5, true);
    const AdmitResult r = store.admit(a);
    ASSERT_EQ(r.status, AdmitStatus::Accepted);
    EXPECT_EQ(store.admit(a).status, AdmitStatus::Duplicate);

    const std::string path = dir + "/nested/" + r.name;
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), a.payload.size());
    EXPECT_EQ(count_files(dir + "/nested"), 1U);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}


TEST(ArtifactStore, DirectorySinkNeverOverwrites)
{
    const std::string dir = fresh_dir("carvenet_store_keep");
    DirectorySink sink(dir);
    ASSERT_TRUE(sink.prepare());

    const Artifact a = make_artifact(77, 6, true);
    const std::string name = artifact_file_name(77, a.fingerprint);
    {
        std::FILE* f = std::fopen((dir + "/" + name).c_str(), "wb");
        ASSERT_NE(f, nullptr);
        std::fputs("previous run", f);
        std::fclose(f);
    }

    ArtifactStore store(&sink);
    const AdmitResult r = store.admit(a);
    ASSERT_EQ(r.status, AdmitStatus::Accepted);
    EXPECT_NE(r.name, name);
    EXPECT_EQ(r.name.substr(r.name.size() - 6), "_1.jpg");
    EXPECT_EQ(std::filesystem::file_size(dir + "/" + name), 12U);
    EXPECT_EQ(std::filesystem::file_size(dir + "/" + r.name),
              a.payload.size());

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

}  // namespace carvenet
