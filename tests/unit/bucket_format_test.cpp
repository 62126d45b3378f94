#include <gtest/gtest.h>
#include "bucket_format.hpp"
#include "frame_codec.hpp"
#include "unit_test_utils.hpp"
#include <set>

using unit_test_utils::bytesOf;
using unit_test_utils::makeHash;

TEST(BucketFormatTest, FilenameSanitizing) {
    EXPECT_EQ(makeFilenameSafe("urn:adsk.wipprod:fs.file:vf.abc?version=1"),
              "urn_adsk.wipprod_fs.file_vf.abc_version=1");
    EXPECT_EQ(makeFilenameSafe("a<b>c\"d/e\\f|g*h"), "a_b_c_d_e_f_g_h");
    EXPECT_EQ(makeFilenameSafe("plain-name_1"), "plain-name_1");
    EXPECT_EQ(makeFilenameSafe(""), "_");
    EXPECT_EQ(makeFilenameSafe("."), "_.");
    EXPECT_EQ(makeFilenameSafe(".."), "_..");
}

TEST(BucketFormatTest, BucketFileNames) {
    EXPECT_EQ(dataFileName("bucket"), "bucket_data");
    EXPECT_EQ(metadataFileName("bucket"), "bucket_metadata");
    EXPECT_TRUE(isMetadataFileName("bucket_metadata"));
    EXPECT_FALSE(isMetadataFileName("bucket"));
    EXPECT_FALSE(isMetadataFileName("_metadata"));
    EXPECT_FALSE(isMetadataFileName("bucket_data"));
    EXPECT_EQ(dataFileNameFor("bucket_metadata"), "bucket_data");
}

TEST(BucketFormatTest, BucketFileNamesNeverCollide) {
    // A bucket whose name ends in the metadata suffix
    std::string plain = makeFilenameSafe("m");
    std::string suffixed = makeFilenameSafe("m_metadata");

    std::set<std::string> names{dataFileName(plain), metadataFileName(plain),
                                dataFileName(suffixed), metadataFileName(suffixed)};
    EXPECT_EQ(names.size(), 4u);
    EXPECT_FALSE(isMetadataFileName(dataFileName(suffixed)));
    EXPECT_EQ(dataFileNameFor(metadataFileName(suffixed)), dataFileName(suffixed));
}

TEST(BucketFormatTest, AssembleGroupsByBucketInInputOrder) {
    std::vector<ContentHash> hashes{makeHash(1), makeHash(2), makeHash(3)};
    std::vector<std::string> buckets{"b", "a", "b"};
    std::vector<std::vector<char>> datas{bytesOf("one"), bytesOf("two"), bytesOf("three")};

    auto batches = assembleBatches(hashes, buckets, datas);

    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].bucket_name, "b");
    EXPECT_EQ(batches[1].bucket_name, "a");

    const BucketBatch& b = batches[0];
    EXPECT_EQ(b.data, bytesOf("onethree"));
    ASSERT_EQ(b.hashes.size(), 2u);
    EXPECT_EQ(b.hashes[0], makeHash(1));
    EXPECT_EQ(b.hashes[1], makeHash(3));
    EXPECT_EQ(b.sizes, (std::vector<uint32_t>{3, 5}));

    ASSERT_EQ(b.metadata.size(), 2 * METADATA_STRIDE);
    EXPECT_EQ(ContentHash::fromBytes(b.metadata, 0), makeHash(1));
    EXPECT_EQ(readUint32LE(b.metadata.data() + HASH_SIZE), 3u);
    EXPECT_EQ(ContentHash::fromBytes(b.metadata, METADATA_STRIDE), makeHash(3));
    EXPECT_EQ(readUint32LE(b.metadata.data() + METADATA_STRIDE + HASH_SIZE), 5u);
}

TEST(BucketFormatTest, AssembleRejectsMismatchedLengths) {
    EXPECT_THROW(assembleBatches({makeHash(1)}, {"a", "b"}, {bytesOf("x")}), std::invalid_argument);
    EXPECT_THROW(assembleBatches({makeHash(1)}, {"a"}, {}), std::invalid_argument);
}

TEST(BucketFormatTest, ParseRecordsComputesOffsets) {
    auto batches = assembleBatches({makeHash(1), makeHash(2)}, {"a", "a"}, {bytesOf("12345"), bytesOf("678")});
    BucketIndex index;

    int64_t data_size = parseMetadataRecords(batches[0].metadata, index);

    EXPECT_EQ(data_size, 8);
    ASSERT_EQ(index.size(), 2u);
    EXPECT_EQ(index[makeHash(1)].offset, 0);
    EXPECT_EQ(index[makeHash(1)].size, 5u);
    EXPECT_EQ(index[makeHash(2)].offset, 5);
    EXPECT_EQ(index[makeHash(2)].size, 3u);
}

TEST(BucketFormatTest, LaterRecordShadowsEarlierCopy) {
    auto batches = assembleBatches({makeHash(1), makeHash(2), makeHash(1)}, {"a", "a", "a"},
                                   {bytesOf("aa"), bytesOf("bbb"), bytesOf("cccc")});
    BucketIndex index;

    EXPECT_EQ(parseMetadataRecords(batches[0].metadata, index), 9);
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index[makeHash(1)].offset, 5);
    EXPECT_EQ(index[makeHash(1)].size, 4u);
}

TEST(BucketFormatTest, PartialRecordIsCorruption) {
    auto batches = assembleBatches({makeHash(1)}, {"a"}, {bytesOf("abc")});
    std::vector<char> records = batches[0].metadata;
    records.resize(records.size() - 1);

    BucketIndex index;
    EXPECT_EQ(parseMetadataRecords(records, index), -1);
    EXPECT_TRUE(index.empty());
}

TEST(BucketFormatTest, EntryCount) {
    EXPECT_EQ(entryCountForMetadataSize(0), 0);
    EXPECT_EQ(entryCountForMetadataSize(METADATA_OFFSET), 0);
    EXPECT_EQ(entryCountForMetadataSize(METADATA_OFFSET + 3 * METADATA_STRIDE), 3);
}
