#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace RecordForge {
namespace path {

struct PathElement {
    static constexpr std::size_t NO_INDEX = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NO_INDEX;   // fixed-size arrays
    std::string field_name;               // record fields, override keys

    PathElement() = default;

    PathElement(std::size_t index)
        : array_index(index)
    {}

    PathElement(std::string_view key)
        : field_name(key)
    {}

    bool isIndex() const { return array_index != NO_INDEX; }
};

// field names are copied, a path outlives the overrides that produced it
struct Path {
    std::vector<PathElement> storage;
    std::size_t currentLength = 0;

    Path() = default;

    explicit Path(std::size_t expectedDepth) {
        storage.reserve(expectedDepth);
    }

    void push_child(PathElement && el) {
        storage.emplace_back(std::move(el));
        currentLength ++;
    }
    void pop() {
        storage.pop_back();
        currentLength --;
    }

    bool empty() const { return currentLength == 0; }

    std::string toString() const {
        std::string out;
        for(std::size_t i = 0; i < currentLength; i ++) {
            const PathElement & el = storage[i];
            if(el.isIndex()) {
                out += "[" + std::to_string(el.array_index) + "]";
            } else {
                if(!out.empty()) out += ".";
                out += el.field_name;
            }
        }
        return out;
    }

    // "Order.customer.email"
    std::string toString(std::string_view root) const {
        std::string out(root);
        for(std::size_t i = 0; i < currentLength; i ++) {
            const PathElement & el = storage[i];
            if(el.isIndex()) {
                out += "[" + std::to_string(el.array_index) + "]";
            } else {
                out += ".";
                out += el.field_name;
            }
        }
        return out;
    }
};

}
}
