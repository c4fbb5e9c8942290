#include "carvenet/jpeg_carve.h"

#include "synthetic_jpeg.h"

#include <gtest/gtest.h>

#include <vector>

namespace carvenet {
namespace {

    using test_support::make_jpeg;
    using test_support::place;
    using test_support::push_u16be;
    using test_support::push_u8;


    static std::vector<Artifact> carve_all(std::span<const std::byte> bytes,
                                           uint64_t primary_length,
                                           uint64_t base_offset,
                                           CarveResult* result = nullptr)
    {
        std::vector<Artifact> out;
        const CarveResult r = carve_chunk(bytes, primary_length, base_offset,
                                          CarveOptions {}, &out);
        if (result) {
            *result = r;
        }
        return out;
    }

}  // namespace


TEST(JpegCarve, FindsSingleImage)
{
    std::vector<std::byte> image(4096, std::byte { 0 });
    const std::vector<std::byte> jpeg = make_jpeg(1000, 1);
    place(&image, 300, jpeg);

    CarveResult r;
    const std::vector<Artifact> out = carve_all(image, image.size(), 0, &r);
    ASSERT_EQ(out.size(), 1U);
    EXPECT_EQ(out[0].absolute_start, 300U);
    EXPECT_EQ(out[0].payload, jpeg);
    EXPECT_TRUE(out[0].has_fingerprint);

    Fingerprint expected;
    ASSERT_TRUE(compute_fingerprint(jpeg, &expected));
    EXPECT_EQ(out[0].fingerprint, expected);

    EXPECT_EQ(r.status, CarveStatus::Ok);
    EXPECT_EQ(r.candidates, 1U);
    EXPECT_EQ(r.emitted, 1U);
    EXPECT_EQ(r.rejected, 0U);
}


TEST(JpegCarve, AppliesBaseOffset)
{
    std::vector<std::byte> chunk(2048, std::byte { 0 });
    place(&chunk, 10, make_jpeg(500, 2));
    const std::vector<Artifact> out = carve_all(chunk, chunk.size(), 1U << 20);
    ASSERT_EQ(out.size(), 1U);
    EXPECT_EQ(out[0].absolute_start, (1U << 20) + 10U);
}


TEST(JpegCarve, SkipsEmbeddedThumbnailEnd)
{
    // APP1 segment carrying a complete thumbnail; its EOI must not end the
    // outer image.
    std::vector<std::byte> thumb = make_jpeg(120, 9);
    std::vector<std::byte> outer;
    push_u16be(&outer, 0xFFD8U);
    push_u16be(&outer, 0xFFE1U);
    push_u16be(&outer, static_cast<uint16_t>(2U + thumb.size()));
    outer.insert(outer.end(), thumb.begin(), thumb.end());
    const std::vector<std::byte> tail = make_jpeg(300, 3);
    // Reuse the tail's segments after its SOI.
    outer.insert(outer.end(), tail.begin() + 2, tail.end());

    std::vector<std::byte> image(2048, std::byte { 0 });
    place(&image, 64, outer);

    CarveResult r;
    const std::vector<Artifact> out = carve_all(image, image.size(), 0, &r);
    // The outer image plus the thumbnail, which is itself a valid JPEG.
    ASSERT_EQ(out.size(), 2U);
    EXPECT_EQ(out[0].absolute_start, 64U);
    EXPECT_EQ(out[0].payload, outer);
    EXPECT_EQ(out[1].absolute_start, 64U + 6U);
    EXPECT_EQ(out[1].payload, thumb);
}


TEST(JpegCarve, DiscardsUnterminatedCandidates)
{
    std::vector<std::byte> jpeg = make_jpeg(600, 4);
    jpeg.resize(jpeg.size() - 2U);  // drop EOI

    std::vector<std::byte> image(1024, std::byte { 0 });
    place(&image, 1024 - jpeg.size(), jpeg);

    CarveResult r;
    EXPECT_TRUE(carve_all(image, image.size(), 0, &r).empty());
    EXPECT_EQ(r.candidates, 1U);
    EXPECT_EQ(r.unterminated, 1U);
}


TEST(JpegCarve, DiscardsCandidatesAboveSizeLimit)
{
    std::vector<std::byte> image(8192, std::byte { 0 });
    place(&image, 0, make_jpeg(5000, 5));

    CarveOptions options;
    options.limits.max_artifact_bytes = 4096;
    std::vector<Artifact> out;
    const CarveResult r = carve_chunk(image, image.size(), 0, options, &out);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(r.unterminated, 1U);

    uint64_t end = 0;
    EXPECT_EQ(locate_jpeg_end(image, 0, options.limits, &end),
              CandidateStatus::TooLarge);
    options.limits.max_artifact_bytes = 5000;
    EXPECT_EQ(locate_jpeg_end(image, 0, options.limits, &end),
              CandidateStatus::Ok);
    EXPECT_EQ(end, 5000U);
}


TEST(JpegCarve, RejectsImplausibleCandidates)
{
    std::vector<std::byte> image(2048, std::byte { 0 });

    // Too small.
    place(&image, 0, make_jpeg(101, 6));
    std::vector<std::byte> tiny;
    push_u16be(&tiny, 0xFFD8U);
    push_u16be(&tiny, 0xFFE0U);
    push_u16be(&tiny, 4U);
    push_u16be(&tiny, 0x0101U);
    push_u16be(&tiny, 0xFFD9U);
    place(&image, 400, tiny);

    // Random bytes after SOI instead of a marker segment.
    std::vector<std::byte> noise;
    push_u16be(&noise, 0xFFD8U);
    for (uint32_t i = 0; i < 200U; ++i) {
        push_u8(&noise, static_cast<uint8_t>(0x10U + (i % 0x40U)));
    }
    push_u16be(&noise, 0xFFD9U);
    place(&image, 800, noise);

    CarveResult r;
    const std::vector<Artifact> out = carve_all(image, image.size(), 0, &r);
    ASSERT_EQ(out.size(), 1U);
    EXPECT_EQ(out[0].absolute_start, 0U);
    EXPECT_EQ(r.candidates, 3U);
    EXPECT_EQ(r.rejected, 2U);

    CarveLimits limits;
    EXPECT_FALSE(validate_jpeg_candidate(tiny, limits));
    limits.min_artifact_bytes = 0;
    EXPECT_TRUE(validate_jpeg_candidate(tiny, limits));
    EXPECT_FALSE(validate_jpeg_candidate(noise, limits));
}


TEST(JpegCarve, CandidateStartingInOverlapBelongsToNextChunk)
{
    // Chunk layout: 1000 primary bytes, 500 overlap bytes.
    std::vector<std::byte> chunk(1500, std::byte { 0 });
    place(&chunk, 1100, make_jpeg(200, 7));

    CarveResult r;
    EXPECT_TRUE(carve_all(chunk, 1000, 0, &r).empty());
    EXPECT_EQ(r.candidates, 1U);
    EXPECT_EQ(r.foreign, 1U);
    EXPECT_EQ(r.emitted, 0U);
    EXPECT_EQ(r.rejected, 0U);
}


TEST(JpegCarve, OverlapCandidateWithoutEndIsUnterminated)
{
    std::vector<std::byte> chunk(1500, std::byte { 0 });
    const std::vector<std::byte> owned = make_jpeg(300, 11);
    place(&chunk, 100, owned);
    // Start marker in the overlap tail whose image runs past the chunk.
    const std::vector<std::byte> cut = make_jpeg(600, 12);
    place(&chunk, 1200, std::vector<std::byte>(cut.begin(), cut.begin() + 300));

    CarveResult r;
    const std::vector<Artifact> out = carve_all(chunk, 1000, 0, &r);
    ASSERT_EQ(out.size(), 1U);
    EXPECT_EQ(out[0].absolute_start, 100U);
    EXPECT_EQ(r.candidates, 2U);
    EXPECT_EQ(r.unterminated, 1U);
    EXPECT_EQ(r.foreign, 0U);
}


TEST(JpegCarve, StraddlingImageIsCarvedExactlyOnce)
{
    // Source: two chunks of 1000 bytes with a 400 byte overlap; the image
    // starts at 900 and ends at 1200.
    std::vector<std::byte> source(2000, std::byte { 0 });
    const std::vector<std::byte> jpeg = make_jpeg(300, 8);
    place(&source, 900, jpeg);

    const std::span<const std::byte> all(source);
    CarveResult r0;
    const std::vector<Artifact> first = carve_all(all.subspan(0, 1400), 1000,
                                                  0, &r0);
    CarveResult r1;
    const std::vector<Artifact> second = carve_all(all.subspan(1000), 1000,
                                                   1000, &r1);

    ASSERT_EQ(first.size(), 1U);
    EXPECT_EQ(first[0].absolute_start, 900U);
    EXPECT_EQ(first[0].payload, jpeg);
    EXPECT_TRUE(second.empty());
    EXPECT_EQ(r1.candidates, 0U);
}


TEST(JpegCarve, SoiSplitAcrossPrimaryEndIsOwnedByEarlierChunk)
{
    std::vector<std::byte> source(2000, std::byte { 0 });
    place(&source, 999, make_jpeg(300, 10));

    const std::span<const std::byte> all(source);
    const std::vector<Artifact> first = carve_all(all.subspan(0, 1400), 1000,
                                                  0);
    const std::vector<Artifact> second = carve_all(all.subspan(1000), 1000,
                                                   1000);
    ASSERT_EQ(first.size(), 1U);
    EXPECT_EQ(first[0].absolute_start, 999U);
    EXPECT_TRUE(second.empty());
}


TEST(JpegCarve, CapsArtifactsPerChunk)
{
    std::vector<std::byte> image(4096, std::byte { 0 });
    for (uint32_t i = 0; i < 5U; ++i) {
        place(&image, i * 500U, make_jpeg(400, 20U + i));
    }
    CarveOptions options;
    options.limits.max_artifacts = 3;
    std::vector<Artifact> out;
    const CarveResult r = carve_chunk(image, image.size(), 0, options, &out);
    EXPECT_EQ(r.status, CarveStatus::LimitExceeded);
    EXPECT_EQ(out.size(), 3U);
    EXPECT_EQ(r.emitted, 3U);
    EXPECT_EQ(r.dropped, 2U);
}


TEST(JpegCarve, MalformedPrimaryLength)
{
    std::vector<std::byte> chunk(100, std::byte { 0 });
    std::vector<Artifact> out;
    const CarveResult r = carve_chunk(chunk, 101, 0, CarveOptions {}, &out);
    EXPECT_EQ(r.status, CarveStatus::Malformed);
    EXPECT_TRUE(out.empty());
}


TEST(JpegCarve, NoSignaturesNoArtifacts)
{
    std::vector<std::byte> image(10000);
    for (size_t i = 0; i < image.size(); ++i) {
        image[i] = std::byte { static_cast<uint8_t>((i * 7U) % 0xFFU) };
    }
    CarveResult r;
    EXPECT_TRUE(carve_all(image, image.size(), 0, &r).empty());
    EXPECT_EQ(r.candidates, 0U);
}

}  // namespace carvenet
