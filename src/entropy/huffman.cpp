#include "entropy/huffman.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hufz {

uint64_t HuffNode::count() const {
    if (is_leaf()) return leaf().count;
    return internal().count;
}

const Code& CodeTable::code(uint32_t sym) const {
    if (!has(sym)) {
        throw std::logic_error("huffman: no code for symbol " + std::to_string(sym));
    }
    return enc[sym].bits;
}

namespace {

struct HeapItem {
    uint64_t freq;
    uint32_t symbol; // for tie-break; if internal, smallest symbol in subtree
    HuffNodePtr node;
};

struct HeapComp {
    bool operator()(const HeapItem& a, const HeapItem& b) const {
        if (a.freq != b.freq) return a.freq > b.freq; // min-heap
        return a.symbol > b.symbol; // tie-break by smallest symbol
    }
};

HeapItem pop_min(std::vector<HeapItem>& heap) {
    std::pop_heap(heap.begin(), heap.end(), HeapComp{});
    HeapItem top = std::move(heap.back());
    heap.pop_back();
    return top;
}

void push_item(std::vector<HeapItem>& heap, HeapItem item) {
    heap.push_back(std::move(item));
    std::push_heap(heap.begin(), heap.end(), HeapComp{});
}

} // namespace

HuffNodePtr build_huffman_tree(const FrequencyTable& ft) {
    std::vector<HeapItem> heap;
    heap.reserve(kSymbolCount);

    // Collect leaves
    for (uint32_t i = 0; i < kSymbolCount; ++i) {
        if (ft.counts[i] == 0) continue;
        auto leaf = std::make_unique<HuffNode>();
        leaf->v = HuffLeaf{i, ft.counts[i]};
        push_item(heap, HeapItem{ft.counts[i], i, std::move(leaf)});
    }
    if (heap.empty()) {
        throw std::logic_error("huffman: all frequencies are zero");
    }

    while (heap.size() > 1) {
        HeapItem a = pop_min(heap);
        HeapItem b = pop_min(heap);
        if (a.freq > std::numeric_limits<uint64_t>::max() - b.freq) {
            throw std::runtime_error("huffman: frequency overflow");
        }
        const uint64_t sum = a.freq + b.freq;
        const uint32_t min_sym = std::min(a.symbol, b.symbol);

        auto parent = std::make_unique<HuffNode>();
        parent->v = HuffInternal{sum, std::move(a.node), std::move(b.node)};
        push_item(heap, HeapItem{sum, min_sym, std::move(parent)});
    }
    return std::move(heap.front().node);
}

CodeTable build_code_table(const HuffNode& root) {
    CodeTable t;
    std::vector<std::pair<const HuffNode*, Code>> stack;
    stack.push_back({&root, Code{}});

    while (!stack.empty()) {
        auto [node, path] = std::move(stack.back());
        stack.pop_back();
        if (node->is_leaf()) {
            auto& e = t.enc[node->leaf().symbol];
            if (e.valid) {
                throw std::logic_error("huffman: duplicate leaf symbol");
            }
            e.bits = std::move(path);
            e.valid = true;
            continue;
        }
        const HuffInternal& in = node->internal();
        // push right then left so left processed first
        Code right = path;
        right.push_back(true);
        stack.push_back({in.right.get(), std::move(right)});
        path.push_back(false);
        stack.push_back({in.left.get(), std::move(path)});
    }
    return t;
}

std::string code_to_string(const Code& code) {
    std::string s;
    s.reserve(code.size());
    for (bool b : code) s.push_back(b ? '1' : '0');
    return s;
}

} // namespace hufz
