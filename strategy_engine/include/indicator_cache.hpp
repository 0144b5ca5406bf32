#pragma once

#include "ast.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace strategy_engine {

    // Canonical signature of an indicator call: name_arg1_arg2...
    //   literal    -> "20", "0.5"
    //   field      -> "close"
    //   indicator  -> its own canonical key
    //   arithmetic -> "(left op right)"
    std::string canonicalKey(const ast::Indicator& call);
    std::string canonicalArgument(const ast::Node& arg);

    // --- IndicatorCache ---
    // Every distinct indicator call reachable from the strategy, nested
    // arguments included, keyed by canonical signature. Iteration is in
    // sorted key order.
    class IndicatorCache {
    public:
        // Walks the tree and records each indicator call not seen before.
        void collect(const ast::NodePtr& node);

        const std::map<std::string, ast::NodePtr>& entries() const { return entries_; }
        std::vector<std::string> keys() const;
        bool contains(const std::string& key) const;
        std::size_t size() const { return entries_.size(); }

    private:
        std::map<std::string, ast::NodePtr> entries_;
    };

} // namespace strategy_engine
