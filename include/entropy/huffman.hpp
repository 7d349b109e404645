#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "entropy/bit_io.hpp"
#include "entropy/frequency_table.hpp"

namespace hufz {

struct HuffNode;
using HuffNodePtr = std::unique_ptr<HuffNode>;

struct HuffLeaf {
    uint32_t symbol{0};
    uint64_t count{0};
};

struct HuffInternal {
    uint64_t count{0}; // left->count() + right->count()
    HuffNodePtr left;
    HuffNodePtr right;
};

// Leaf or internal node; children are owned exclusively by their parent.
struct HuffNode {
    std::variant<HuffLeaf, HuffInternal> v;

    bool is_leaf() const { return std::holds_alternative<HuffLeaf>(v); }
    const HuffLeaf& leaf() const { return std::get<HuffLeaf>(v); }
    const HuffInternal& internal() const { return std::get<HuffInternal>(v); }
    uint64_t count() const;
};

struct CodeTable {
    struct Entry {
        Code bits;
        bool valid{false};
    };
    std::array<Entry, kSymbolCount> enc;

    bool has(uint32_t sym) const { return sym < kSymbolCount && enc[sym].valid; }
    // Throws std::logic_error for a symbol that is not a leaf of the tree.
    const Code& code(uint32_t sym) const;
};

// Min-heap merge over every symbol with a non-zero count.
// Ties on count go to the node whose subtree holds the smallest symbol;
// first node popped becomes the left child.
// An empty-input table (sentinel only) yields a single leaf as root.
HuffNodePtr build_huffman_tree(const FrequencyTable& ft);

// Root-to-leaf paths, left = 0, right = 1. A single-leaf root gets the
// empty code.
CodeTable build_code_table(const HuffNode& root);

// "0101..." rendering, for diagnostics and tests.
std::string code_to_string(const Code& code);

} // namespace hufz
