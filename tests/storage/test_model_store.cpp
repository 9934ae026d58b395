/**
 * @file test_model_store.cpp
 * @brief Tests for the layout-driven read/write/delete engine
 *
 * Covers round trips for every layout shape, delete semantics, bound and
 * tag validation (with proof that rejected writes touch no slot), packed
 * records and backend failure propagation.
 *
 * @author LukeFrankio
 * @date 2025-10-11
 */

#include <tessera/storage/engine.hpp>
#include <tessera/storage/addressing.hpp>
#include <tessera/storage/memory_backend.hpp>
#include <tessera/layout/byte_array.hpp>
#include <tessera/core/hash.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace tessera;
using namespace tessera::storage;
using layout::FieldLayout;
using layout::Layout;

namespace {

auto selector(std::string_view name) -> Word {
    return *hash::selector_from_name(name);
}

/**
 * @brief Memory backend that counts substrate calls
 */
class CountingBackend final : public StorageBackend {
public:
    [[nodiscard]] auto get(const Word& address) const -> Result<Word> override {
        ++reads;
        return inner.get(address);
    }

    [[nodiscard]] auto set(const Word& address, const Word& value) -> Result<void> override {
        ++writes;
        return inner.set(address, value);
    }

    MemoryBackend inner;
    mutable usize reads = 0;
    usize writes = 0;
};

const Word MODEL = 0xC0FFEE;
const Word KEY = 0x1234;

} // anonymous namespace

class ModelStoreTest : public ::testing::Test {
protected:
    CountingBackend backend;
    ModelStore store{backend};

    auto values(std::initializer_list<Word> words) -> std::vector<Word> {
        return std::vector<Word>(words);
    }
};

// ========== Concrete Scenarios ==========

TEST_F(ModelStoreTest, FixedPairWriteReadDelete) {
    const auto layout = Layout::fixed({251, 251});

    ASSERT_TRUE(store.write_model(MODEL, KEY, values({1, 2}), layout).has_value());
    EXPECT_EQ(*store.read_model(MODEL, KEY, layout), values({1, 2}));

    ASSERT_TRUE(store.delete_model(MODEL, KEY, layout).has_value());
    EXPECT_EQ(*store.read_model(MODEL, KEY, layout), values({0, 0}));
    EXPECT_EQ(backend.inner.slot_count(), 0u);
}

TEST_F(ModelStoreTest, ArrayDeleteKeepsOnlyLength) {
    const auto layout = Layout::array(Layout::fixed({251}));

    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({3, 10, 20, 30}), layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({3, 10, 20, 30}));

    ASSERT_TRUE(store.delete_layout(MODEL, KEY, layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({0}));

    // the three elements are orphaned, not zeroed
    EXPECT_EQ(backend.inner.slot_count(), 3u);
}

TEST_F(ModelStoreTest, StructWithEnumSwitchesToUnitVariant) {
    const auto layout = Layout::structure({
        FieldLayout{selector("a"), Layout::fixed({8})},
        FieldLayout{selector("b"), Layout::enumeration({
            FieldLayout{Word{0}, Layout::fixed({32})},
            FieldLayout{Word{1}, Layout::fixed({})},
        })},
    });

    ASSERT_TRUE(store.write_model(MODEL, KEY, values({5, 0, 42}), layout).has_value());
    EXPECT_EQ(*store.read_model(MODEL, KEY, layout), values({5, 0, 42}));

    ASSERT_TRUE(store.write_model(MODEL, KEY, values({5, 1}), layout).has_value());
    EXPECT_EQ(*store.read_model(MODEL, KEY, layout), values({5, 1}));
}

// ========== Round Trips ==========

TEST_F(ModelStoreTest, RoundTripEveryShape) {
    const auto item = Layout::structure({
        FieldLayout{selector("qty"), Layout::fixed({32})},
        FieldLayout{selector("label"), Layout::byte_array()},
    });
    const auto layout = Layout::structure({
        FieldLayout{selector("id"), Layout::fixed({251})},
        FieldLayout{selector("pair"), Layout::tuple({Layout::fixed({8}), Layout::fixed({128, 128})})},
        FieldLayout{selector("grid"), Layout::fixed_array(Layout::fixed({1}), 3)},
        FieldLayout{selector("items"), Layout::array(item)},
        FieldLayout{selector("state"), Layout::enumeration({
            FieldLayout{Word{0}, Layout::fixed({})},
            FieldLayout{Word{2}, Layout::array(Layout::fixed({16}))},
        })},
    });

    const auto written = values({
        99,                      // id
        1, 2, 3,                 // pair
        1, 0, 1,                 // grid
        2,                       // items length
        5, 0, 0x6162, 2,         // items[0] = {5, "ab"}
        6, 0, 0, 0,              // items[1] = {6, ""}
        2, 2, 100, 200,          // state = variant 2 ([100, 200])
    });

    ASSERT_TRUE(store.write_model(MODEL, KEY, written, layout).has_value());
    const auto read = store.read_model(MODEL, KEY, layout);
    ASSERT_TRUE(read.has_value()) << read.error().what();
    EXPECT_EQ(*read, written);
}

TEST_F(ModelStoreTest, ByteArrayRoundTrip) {
    const auto layout = Layout::byte_array();
    const std::string text = "a byte array long enough to spill into a second word";
    const auto encoded = layout::encode_byte_array(text);

    ASSERT_TRUE(store.write_layout(MODEL, KEY, encoded, layout).has_value());
    const auto read = store.read_layout(MODEL, KEY, layout);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, encoded);
    EXPECT_EQ(*layout::decode_byte_array(*read), text);

    ASSERT_TRUE(store.delete_layout(MODEL, KEY, layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({0, 0, 0}));
}

TEST_F(ModelStoreTest, ZeroWidthItemsStoreOnlyLength) {
    const auto layout = Layout::array(Layout::structure({}));
    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({3}), layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({3}));
    EXPECT_EQ(backend.inner.slot_count(), 1u);
}

TEST_F(ModelStoreTest, MembersLiveUnderFieldKeys) {
    const auto layout = Layout::structure({
        FieldLayout{selector("x"), Layout::fixed({32})},
        FieldLayout{selector("y"), Layout::fixed({32})},
    });
    ASSERT_TRUE(store.write_model(MODEL, KEY, values({10, 20}), layout).has_value());

    const auto y_key = field_key(KEY, selector("y"));
    ASSERT_TRUE(y_key.has_value());
    EXPECT_EQ(*store.read_layout(MODEL, *y_key, Layout::fixed({32})), values({20}));

    ASSERT_TRUE(store.write_layout(MODEL, *y_key, values({21}), Layout::fixed({32})).has_value());
    EXPECT_EQ(*store.read_model(MODEL, KEY, layout), values({10, 21}));
}

// ========== Delete Semantics ==========

TEST_F(ModelStoreTest, DeleteOfFixedShapeReadsAllZero) {
    const auto layout = Layout::structure({
        FieldLayout{selector("a"), Layout::fixed({8, 8})},
        FieldLayout{selector("t"), Layout::tuple({
            Layout::fixed({1}),
            Layout::fixed_array(Layout::fixed({16}), 2),
        })},
        FieldLayout{selector("e"), Layout::enumeration({
            FieldLayout{Word{0}, Layout::fixed({32})},
            FieldLayout{Word{1}, Layout::fixed({8})},
        })},
    });
    const auto written = values({1, 2, 1, 3, 4, 1, 9});

    ASSERT_TRUE(store.write_model(MODEL, KEY, written, layout).has_value());
    ASSERT_TRUE(store.delete_model(MODEL, KEY, layout).has_value());

    const auto read = store.read_model(MODEL, KEY, layout);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, std::vector<Word>(written.size()));
    EXPECT_EQ(backend.inner.slot_count(), 0u);
}

TEST_F(ModelStoreTest, DeleteIsIdempotent) {
    const auto layout = Layout::structure({
        FieldLayout{selector("a"), Layout::fixed({8})},
        FieldLayout{selector("b"), Layout::array(Layout::fixed({8}))},
    });
    ASSERT_TRUE(store.write_model(MODEL, KEY, values({1, 2, 3, 4}), layout).has_value());

    ASSERT_TRUE(store.delete_model(MODEL, KEY, layout).has_value());
    const auto slots_after_first = backend.inner.slot_count();
    const auto read_after_first = *store.read_model(MODEL, KEY, layout);

    ASSERT_TRUE(store.delete_model(MODEL, KEY, layout).has_value());
    EXPECT_EQ(backend.inner.slot_count(), slots_after_first);
    EXPECT_EQ(*store.read_model(MODEL, KEY, layout), read_after_first);
    EXPECT_EQ(read_after_first, values({0, 0}));
}

TEST_F(ModelStoreTest, ReadBeforeWriteIsZero) {
    const auto layout = Layout::structure({
        FieldLayout{selector("a"), Layout::fixed({8, 8})},
        FieldLayout{selector("list"), Layout::array(Layout::fixed({8}))},
        FieldLayout{selector("name"), Layout::byte_array()},
        FieldLayout{selector("option"), Layout::enumeration({
            FieldLayout{Word{1}, Layout::fixed({8})},
        })},
    });

    const auto read = store.read_model(MODEL, KEY, layout);
    ASSERT_TRUE(read.has_value()) << read.error().what();
    EXPECT_EQ(*read, values({0, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(backend.writes, 0u);
}

TEST_F(ModelStoreTest, DeleteOfNeverWrittenEnumIsNoOp) {
    const auto layout = Layout::enumeration({FieldLayout{Word{1}, Layout::fixed({8})}});
    ASSERT_TRUE(store.delete_layout(MODEL, KEY, layout).has_value());
    EXPECT_EQ(backend.writes, 0u);
}

// ========== Enums ==========

TEST_F(ModelStoreTest, EnumSwitchesVariantsCleanly) {
    const auto layout = Layout::enumeration({
        FieldLayout{Word{0}, Layout::fixed({32})},
        FieldLayout{Word{1}, Layout::fixed({8, 8})},
    });

    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({0, 42}), layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({0, 42}));

    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({1, 7, 8}), layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({1, 7, 8}));

    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({0, 43}), layout).has_value());
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({0, 43}));
}

TEST_F(ModelStoreTest, EnumPayloadDoesNotShareTheTagSlot) {
    const auto layout = Layout::enumeration({FieldLayout{Word{1}, Layout::fixed({8, 8})}});
    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({1, 77, 78}), layout).has_value());

    const auto tag_slot = slot_base(MODEL, KEY);
    const auto payload_key = field_key(KEY, Word{1});
    ASSERT_TRUE(tag_slot.has_value());
    ASSERT_TRUE(payload_key.has_value());
    const auto payload_slot = slot_base(MODEL, *payload_key);
    ASSERT_TRUE(payload_slot.has_value());

    EXPECT_EQ(*backend.inner.get(*tag_slot), Word{1});
    EXPECT_EQ(*backend.inner.get(*payload_slot), Word{77});
    EXPECT_EQ(*backend.inner.get(*payload_slot + Word{1}), Word{78});
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), values({1, 77, 78}));
}

TEST_F(ModelStoreTest, RejectsBadVariantTags) {
    const auto layout = Layout::enumeration({FieldLayout{Word{0}, Layout::fixed({8})}});

    const auto too_big = store.write_layout(MODEL, KEY, values({256, 1}), layout);
    ASSERT_FALSE(too_big.has_value());
    EXPECT_EQ(too_big.error().code, ErrorCode::ENGINE_INVALID_VARIANT_VALUE);

    const auto missing = store.write_layout(MODEL, KEY, values({7, 1}), layout);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ENGINE_VARIANT_NOT_FOUND);

    EXPECT_EQ(backend.writes, 0u);
}

TEST_F(ModelStoreTest, ReadOfUnknownStoredTagFails) {
    const auto layout = Layout::enumeration({FieldLayout{Word{0}, Layout::fixed({8})}});
    ASSERT_TRUE(store.write_layout(MODEL, KEY, values({9}), Layout::fixed({8})).has_value());

    const auto read = store.read_layout(MODEL, KEY, layout);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, ErrorCode::ENGINE_INVALID_VARIANT_VALUE);
}

// ========== Bounds and Lengths ==========

TEST(ModelStoreBoundsTest, ArrayLengthAboveMaximumWritesNothing) {
    CountingBackend backend;
    ModelStore store(backend, 4);
    const auto layout = Layout::array(Layout::fixed({8}));

    ASSERT_TRUE(store.write_layout(MODEL, KEY, std::vector<Word>{2, 10, 20}, layout).has_value());
    const auto writes_before = backend.writes;

    const auto rejected =
        store.write_layout(MODEL, KEY, std::vector<Word>{5, 1, 2, 3, 4, 5}, layout);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::ENGINE_INVALID_ARRAY_LENGTH);
    EXPECT_EQ(backend.writes, writes_before);
    EXPECT_EQ(*store.read_layout(MODEL, KEY, layout), (std::vector<Word>{2, 10, 20}));
}

TEST(ModelStoreBoundsTest, ByteArrayLengthAboveMaximumWritesNothing) {
    CountingBackend backend;
    ModelStore store(backend, 1);

    const auto encoded = layout::encode_byte_array(std::string(70, 'z'));  // two full words
    const auto rejected = store.write_layout(MODEL, KEY, encoded, Layout::byte_array());
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::ENGINE_INVALID_ARRAY_LENGTH);
    EXPECT_EQ(backend.writes, 0u);
}

TEST(ModelStoreBoundsTest, NestedArrayBoundIsCheckedBeforeAnyWrite) {
    CountingBackend backend;
    ModelStore store(backend, 2);
    const auto layout = Layout::structure({
        FieldLayout{selector("head"), Layout::fixed({8})},
        FieldLayout{selector("rows"), Layout::array(Layout::array(Layout::fixed({8})))},
    });

    // rows[1] declares 3 items, one past the bound
    const std::vector<Word> written{1, 2, 1, 9, 3, 1, 2, 3};
    const auto rejected = store.write_model(MODEL, KEY, written, layout);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::ENGINE_INVALID_ARRAY_LENGTH);
    EXPECT_EQ(backend.writes, 0u);
}

TEST_F(ModelStoreTest, RejectsShortAndLongBuffers) {
    const auto layout = Layout::fixed({8, 8, 8});

    const auto short_buffer = store.write_model(MODEL, KEY, values({1, 2}), layout);
    ASSERT_FALSE(short_buffer.has_value());
    EXPECT_EQ(short_buffer.error().code, ErrorCode::ENGINE_INVALID_VALUES_LENGTH);

    const auto long_buffer = store.write_model(MODEL, KEY, values({1, 2, 3, 4}), layout);
    ASSERT_FALSE(long_buffer.has_value());
    EXPECT_EQ(long_buffer.error().code, ErrorCode::ENGINE_INVALID_VALUES_LENGTH);

    EXPECT_EQ(backend.writes, 0u);
}

TEST_F(ModelStoreTest, HugeDeclaredLengthFailsFast) {
    const auto layout = Layout::array(Layout::fixed({8}));
    const auto rejected = store.write_layout(MODEL, KEY, values({1'000'000, 1, 2}), layout);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::ENGINE_INVALID_VALUES_LENGTH);
    EXPECT_EQ(backend.writes, 0u);
}

TEST_F(ModelStoreTest, ValidateValuesTouchesNoStorage) {
    const auto layout = Layout::array(Layout::byte_array());
    EXPECT_TRUE(store.validate_values(values({1, 0, 0x41, 1}), layout).has_value());
    EXPECT_EQ(store.validate_values(values({2, 0, 0x41, 1}), layout).error().code,
              ErrorCode::ENGINE_INVALID_VALUES_LENGTH);
    EXPECT_EQ(backend.reads, 0u);
    EXPECT_EQ(backend.writes, 0u);
}

// ========== Model Roots ==========

TEST_F(ModelStoreTest, ModelRootMustBeFixedOrStruct) {
    const auto layout = Layout::array(Layout::fixed({8}));

    EXPECT_EQ(store.write_model(MODEL, KEY, values({0}), layout).error().code,
              ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE);
    EXPECT_EQ(store.read_model(MODEL, KEY, layout).error().code,
              ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE);
    EXPECT_EQ(store.delete_model(MODEL, KEY, Layout::byte_array()).error().code,
              ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE);
    EXPECT_EQ(backend.writes, 0u);
}

// ========== Packed Records ==========

TEST_F(ModelStoreTest, PackedRecordRoundTrip) {
    const std::vector<u8> sizes{8, 64, 1};
    const auto written = values({7, 123'456, 1});

    ASSERT_TRUE(store.write_packed(MODEL, KEY, written, sizes).has_value());
    EXPECT_EQ(backend.inner.slot_count(), 1u);
    EXPECT_EQ(*store.read_packed(MODEL, KEY, sizes), written);

    ASSERT_TRUE(store.delete_packed(MODEL, KEY, sizes).has_value());
    EXPECT_EQ(*store.read_packed(MODEL, KEY, sizes), values({0, 0, 0}));
    EXPECT_EQ(backend.inner.slot_count(), 0u);
}

TEST_F(ModelStoreTest, PackedRecordSpanningWords) {
    const std::vector<u8> sizes{251, 128, 128, 1};
    const auto written = values({Word::mask(251), Word{1} << 127, 5, 1});

    ASSERT_TRUE(store.write_packed(MODEL, KEY, written, sizes).has_value());
    EXPECT_EQ(backend.inner.slot_count(), 3u);
    EXPECT_EQ(*store.read_packed(MODEL, KEY, sizes), written);
}

TEST_F(ModelStoreTest, PackedRejectsOutOfRangeWithoutWriting) {
    const std::vector<u8> sizes{8};
    const auto rejected = store.write_packed(MODEL, KEY, values({256}), sizes);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::PACKING_VALUE_OUT_OF_RANGE);
    EXPECT_EQ(backend.writes, 0u);
}

// ========== Backend Failures ==========

TEST(ModelStoreBackendTest, BackendErrorsPropagate) {
    MemoryBackend backend(1);
    ModelStore store(backend);

    const auto result = store.write_model(MODEL, KEY, std::vector<Word>{1, 2}, Layout::fixed({8, 8}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::STORAGE_RESOURCE_EXHAUSTED);
}
