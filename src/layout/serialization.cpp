/**
 * @file serialization.cpp
 * @brief Layout word encoding and YAML conversion
 *
 * @author LukeFrankio
 * @date 2025-10-12
 */

#include <tessera/layout/serialization.hpp>
#include <tessera/layout/primitive.hpp>
#include <tessera/core/config.hpp>
#include <tessera/core/hash.hpp>
#include <tessera/core/logging.hpp>

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

namespace tessera::layout {

namespace {

// ============================================================================
// Word Encoding
// ============================================================================

auto encode_into(const Layout& layout, std::vector<Word>& out) -> void {
    out.emplace_back(static_cast<u64>(layout.kind()));

    if (const auto* fixed = layout.get_if<Fixed>()) {
        out.emplace_back(fixed->sizes.size());
        for (const auto size : fixed->sizes) {
            out.emplace_back(size);
        }
    } else if (const auto* structure = layout.get_if<Struct>()) {
        out.emplace_back(structure->fields.size());
        for (const auto& field : structure->fields) {
            out.push_back(field.selector);
            encode_into(field.layout, out);
        }
    } else if (const auto* tuple = layout.get_if<Tuple>()) {
        out.emplace_back(tuple->items.size());
        for (const auto& item : tuple->items) {
            encode_into(item, out);
        }
    } else if (const auto* array = layout.get_if<Array>()) {
        encode_into(*array->item, out);
    } else if (const auto* fixed_array = layout.get_if<FixedArray>()) {
        out.emplace_back(fixed_array->count);
        encode_into(*fixed_array->item, out);
    } else if (const auto* enumeration = layout.get_if<Enum>()) {
        out.emplace_back(enumeration->variants.size());
        for (const auto& variant : enumeration->variants) {
            out.push_back(variant.selector);
            encode_into(variant.layout, out);
        }
    }
}

/**
 * @brief Cursor over an encoded layout
 *
 * Every read is bounds-checked; counts are checked against the words left
 * so a corrupt length cannot trigger a huge allocation.
 */
class Decoder {
public:
    explicit Decoder(std::span<const Word> words) : words_(words) {}

    [[nodiscard]] auto done() const noexcept -> bool { return pos_ == words_.size(); }
    [[nodiscard]] auto position() const noexcept -> usize { return pos_; }

    auto next() -> Result<Word> {
        if (pos_ >= words_.size()) {
            return make_error(ErrorCode::LAYOUT_DECODE_FAILED,
                              fmt::format("Truncated layout encoding at word {}", pos_));
        }
        return words_[pos_++];
    }

    /// Reads a count no larger than `limit`.
    auto next_count(u64 limit) -> Result<u64> {
        auto word = next();
        if (!word) {
            return std::unexpected(word.error());
        }
        if (!word->fits_u64() || word->low_u64() > limit) {
            return make_error(ErrorCode::LAYOUT_DECODE_FAILED,
                              fmt::format("Count {} at word {} exceeds {}",
                                          word->to_hex(), pos_ - 1, limit));
        }
        return word->low_u64();
    }

    [[nodiscard]] auto remaining() const noexcept -> u64 { return words_.size() - pos_; }

    auto decode(u32 depth) -> Result<Layout>;

private:
    auto decode_fields(u32 depth) -> Result<std::vector<FieldLayout>>;

    std::span<const Word> words_;
    usize pos_ = 0;
};

auto Decoder::decode_fields(u32 depth) -> Result<std::vector<FieldLayout>> {
    // each field takes at least a selector and a variant index
    auto count = next_count(remaining() / 2);
    if (!count) {
        return std::unexpected(count.error());
    }
    std::vector<FieldLayout> fields;
    fields.reserve(*count);
    for (u64 i = 0; i < *count; ++i) {
        auto selector = next();
        if (!selector) {
            return std::unexpected(selector.error());
        }
        auto child = decode(depth + 1);
        if (!child) {
            return std::unexpected(child.error());
        }
        fields.push_back(FieldLayout{*selector, std::move(*child)});
    }
    return fields;
}

auto Decoder::decode(u32 depth) -> Result<Layout> {
    if (depth > MAX_LAYOUT_DEPTH) {
        return make_error(ErrorCode::LAYOUT_DECODE_FAILED,
                          fmt::format("Layout nesting exceeds {}", MAX_LAYOUT_DEPTH));
    }

    const usize start = pos_;
    auto index = next_count(static_cast<u64>(Layout::Kind::FIXED_ARRAY));
    if (!index) {
        return std::unexpected(index.error());
    }

    switch (static_cast<Layout::Kind>(*index)) {
        case Layout::Kind::FIXED: {
            auto count = next_count(remaining());
            if (!count) {
                return std::unexpected(count.error());
            }
            std::vector<u8> sizes;
            sizes.reserve(*count);
            for (u64 i = 0; i < *count; ++i) {
                auto size = next_count(MAX_FIELD_BITS);
                if (!size) {
                    return std::unexpected(size.error());
                }
                sizes.push_back(static_cast<u8>(*size));
            }
            return Layout::fixed(std::move(sizes));
        }
        case Layout::Kind::STRUCT: {
            auto fields = decode_fields(depth);
            if (!fields) {
                return std::unexpected(fields.error());
            }
            return Layout::structure(std::move(*fields));
        }
        case Layout::Kind::TUPLE: {
            auto count = next_count(remaining());
            if (!count) {
                return std::unexpected(count.error());
            }
            std::vector<Layout> items;
            items.reserve(*count);
            for (u64 i = 0; i < *count; ++i) {
                auto item = decode(depth + 1);
                if (!item) {
                    return std::unexpected(item.error());
                }
                items.push_back(std::move(*item));
            }
            return Layout::tuple(std::move(items));
        }
        case Layout::Kind::ARRAY: {
            auto item = decode(depth + 1);
            if (!item) {
                return std::unexpected(item.error());
            }
            return Layout::array(std::move(*item));
        }
        case Layout::Kind::BYTE_ARRAY:
            return Layout::byte_array();
        case Layout::Kind::ENUM: {
            auto variants = decode_fields(depth);
            if (!variants) {
                return std::unexpected(variants.error());
            }
            return Layout::enumeration(std::move(*variants));
        }
        case Layout::Kind::FIXED_ARRAY: {
            auto count = next_count(MAX_ARRAY_LENGTH);
            if (!count) {
                return std::unexpected(count.error());
            }
            auto item = decode(depth + 1);
            if (!item) {
                return std::unexpected(item.error());
            }
            return Layout::fixed_array(std::move(*item), static_cast<u32>(*count));
        }
    }

    return make_error(ErrorCode::LAYOUT_DECODE_FAILED,
                      fmt::format("Unknown layout variant {} at word {}", *index, start));
}

// ============================================================================
// YAML
// ============================================================================

auto fields_to_yaml(const std::vector<FieldLayout>& fields, bool tags) -> YAML::Node {
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& field : fields) {
        YAML::Node entry;
        if (tags) {
            entry["tag"] = field.selector.low_u64();
        } else {
            entry["selector"] = field.selector.to_hex();
        }
        entry["layout"] = layout_to_yaml(field.layout);
        seq.push_back(entry);
    }
    return seq;
}

auto yaml_error(std::string_view message) -> std::unexpected<Error> {
    return make_error(ErrorCode::LAYOUT_INVALID_YAML, message);
}

auto from_yaml(const YAML::Node& node, u32 depth) -> Result<Layout>;

auto struct_field_from_yaml(const YAML::Node& entry, u32 depth) -> Result<FieldLayout> {
    if (!entry.IsMap() || !entry["layout"]) {
        return yaml_error("Struct field needs a 'layout'");
    }

    Word selector;
    if (const auto name = entry["name"]) {
        auto derived = hash::selector_from_name(name.as<std::string>());
        if (!derived) {
            return std::unexpected(derived.error());
        }
        selector = *derived;
    } else if (const auto hex = entry["selector"]) {
        auto parsed = Word::from_hex(hex.as<std::string>());
        if (!parsed) {
            return yaml_error(fmt::format("Invalid field selector: {}", parsed.error().what()));
        }
        selector = *parsed;
    } else {
        return yaml_error("Struct field needs a 'name' or a 'selector'");
    }

    auto layout = from_yaml(entry["layout"], depth + 1);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    return FieldLayout{selector, std::move(*layout)};
}

auto variant_from_yaml(const YAML::Node& entry, u32 depth) -> Result<FieldLayout> {
    if (!entry.IsMap() || !entry["tag"]) {
        return yaml_error("Enum variant needs a 'tag'");
    }
    const auto tag = entry["tag"].as<u64>();

    // unit variants may leave the layout out
    if (!entry["layout"]) {
        return FieldLayout{Word{tag}, Layout::fixed({})};
    }
    auto layout = from_yaml(entry["layout"], depth + 1);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    return FieldLayout{Word{tag}, std::move(*layout)};
}

auto from_yaml(const YAML::Node& node, u32 depth) -> Result<Layout> {
    if (depth > MAX_LAYOUT_DEPTH) {
        return yaml_error(fmt::format("Layout nesting exceeds {}", MAX_LAYOUT_DEPTH));
    }
    if (!node.IsMap()) {
        return yaml_error("Layout node must be a map");
    }

    if (const auto fixed = node["fixed"]) {
        if (!fixed.IsSequence()) {
            return yaml_error("'fixed' must be a sequence of bit widths");
        }
        std::vector<u8> sizes;
        for (const auto& size_node : fixed) {
            const auto size = size_node.as<u32>();
            if (size == 0 || size > MAX_FIELD_BITS) {
                return make_error(ErrorCode::LAYOUT_INVALID_FIELD_SIZE,
                                  fmt::format("Field size {} outside 1..={}", size, MAX_FIELD_BITS));
            }
            sizes.push_back(static_cast<u8>(size));
        }
        return Layout::fixed(std::move(sizes));
    }

    if (const auto primitive = node["primitive"]) {
        return primitive_layout(primitive.as<std::string>());
    }

    if (const auto structure = node["struct"]) {
        if (!structure.IsSequence()) {
            return yaml_error("'struct' must be a sequence of fields");
        }
        std::vector<FieldLayout> fields;
        for (const auto& entry : structure) {
            auto field = struct_field_from_yaml(entry, depth);
            if (!field) {
                return std::unexpected(field.error());
            }
            fields.push_back(std::move(*field));
        }
        return Layout::structure(std::move(fields));
    }

    if (const auto tuple = node["tuple"]) {
        if (!tuple.IsSequence()) {
            return yaml_error("'tuple' must be a sequence of layouts");
        }
        std::vector<Layout> items;
        for (const auto& entry : tuple) {
            auto item = from_yaml(entry, depth + 1);
            if (!item) {
                return std::unexpected(item.error());
            }
            items.push_back(std::move(*item));
        }
        return Layout::tuple(std::move(items));
    }

    if (const auto fixed_array = node["fixed_array"]) {
        if (!fixed_array["item"] || !fixed_array["count"]) {
            return yaml_error("'fixed_array' needs 'item' and 'count'");
        }
        auto item = from_yaml(fixed_array["item"], depth + 1);
        if (!item) {
            return std::unexpected(item.error());
        }
        return Layout::fixed_array(std::move(*item), fixed_array["count"].as<u32>());
    }

    if (const auto array = node["array"]) {
        auto item = from_yaml(array, depth + 1);
        if (!item) {
            return std::unexpected(item.error());
        }
        return Layout::array(std::move(*item));
    }

    if (node["byte_array"]) {
        return Layout::byte_array();
    }

    if (const auto enumeration = node["enum"]) {
        if (!enumeration.IsSequence()) {
            return yaml_error("'enum' must be a sequence of variants");
        }
        std::vector<FieldLayout> variants;
        for (const auto& entry : enumeration) {
            auto variant = variant_from_yaml(entry, depth);
            if (!variant) {
                return std::unexpected(variant.error());
            }
            variants.push_back(std::move(*variant));
        }
        return Layout::enumeration(std::move(variants));
    }

    return yaml_error("Layout node has no known variant key");
}

} // anonymous namespace

auto encode_layout(const Layout& layout) -> std::vector<Word> {
    std::vector<Word> out;
    encode_into(layout, out);
    return out;
}

auto decode_layout(std::span<const Word> words) -> Result<Layout> {
    Decoder decoder(words);
    auto layout = decoder.decode(0);
    if (!layout) {
        return layout;
    }
    if (!decoder.done()) {
        return make_error(ErrorCode::LAYOUT_DECODE_FAILED,
                          fmt::format("{} trailing words after layout encoding",
                                      words.size() - decoder.position()));
    }
    if (auto valid = layout->validate(MAX_ARRAY_LENGTH); !valid) {
        return std::unexpected(valid.error());
    }
    return layout;
}

auto layout_to_yaml(const Layout& layout) -> YAML::Node {
    YAML::Node node;

    if (const auto* fixed = layout.get_if<Fixed>()) {
        YAML::Node sizes(YAML::NodeType::Sequence);
        for (const auto size : fixed->sizes) {
            sizes.push_back(static_cast<u32>(size));
        }
        node["fixed"] = sizes;
    } else if (const auto* structure = layout.get_if<Struct>()) {
        node["struct"] = fields_to_yaml(structure->fields, false);
    } else if (const auto* tuple = layout.get_if<Tuple>()) {
        YAML::Node items(YAML::NodeType::Sequence);
        for (const auto& item : tuple->items) {
            items.push_back(layout_to_yaml(item));
        }
        node["tuple"] = items;
    } else if (const auto* array = layout.get_if<Array>()) {
        node["array"] = layout_to_yaml(*array->item);
    } else if (const auto* fixed_array = layout.get_if<FixedArray>()) {
        node["fixed_array"]["item"] = layout_to_yaml(*fixed_array->item);
        node["fixed_array"]["count"] = fixed_array->count;
    } else if (layout.get_if<ByteArray>() != nullptr) {
        node["byte_array"] = true;
    } else if (const auto* enumeration = layout.get_if<Enum>()) {
        node["enum"] = fields_to_yaml(enumeration->variants, true);
    }

    return node;
}

auto layout_from_yaml(const YAML::Node& node) -> Result<Layout> {
    Result<Layout> layout = Layout{};
    try {
        layout = from_yaml(node, 0);
    } catch (const YAML::Exception& e) {
        LOG_WARN("Invalid layout YAML: {}", e.what());
        return yaml_error(fmt::format("Invalid layout YAML: {}", e.what()));
    }
    if (!layout) {
        return layout;
    }
    if (auto valid = layout->validate(MAX_ARRAY_LENGTH); !valid) {
        return std::unexpected(valid.error());
    }
    return layout;
}

auto layout_to_yaml_string(const Layout& layout) -> std::string {
    YAML::Emitter out;
    out << layout_to_yaml(layout);
    return out.c_str();
}

auto parse_layout_yaml(std::string_view yaml_text) -> Result<Layout> {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        return yaml_error(fmt::format("YAML parse error: {}", e.what()));
    }
    return layout_from_yaml(root);
}

} // namespace tessera::layout
