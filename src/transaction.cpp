#include <leaf-cpp/transaction.hpp>

#include "doc_state.hpp"

#include <ranges>

namespace leaf_cpp {

Transaction::Transaction(const detail::DocState& state)
    : state_{state} {}

void Transaction::put(std::string_view container, std::string_view key, ScalarValue val) {
    pending_ops_.push_back(Op{
        .action = OpType::put,
        .container = std::string{container},
        .key = std::string{key},
        .value = std::move(val),
    });
}

void Transaction::delete_key(std::string_view container, std::string_view key) {
    pending_ops_.push_back(Op{
        .action = OpType::del,
        .container = std::string{container},
        .key = std::string{key},
        .value = Null{},
    });
}

void Transaction::increment(std::string_view container, std::int64_t delta) {
    pending_ops_.push_back(Op{
        .action = OpType::increment,
        .container = std::string{container},
        .key = {},
        .value = delta,
    });
}

void Transaction::set_message(std::string message) {
    message_ = std::move(message);
}

auto Transaction::get(std::string_view container, std::string_view key) const
    -> std::optional<ScalarValue> {
    // The latest pending write to the key wins
    for (const auto& op : std::views::reverse(pending_ops_)) {
        if (op.container != container || op.key != key) continue;
        if (op.action == OpType::put) return op.value;
        if (op.action == OpType::del) return std::nullopt;
    }
    const auto* state = state_.get_container(std::string{container});
    if (!state) return std::nullopt;
    auto it = state->entries.find(std::string{key});
    if (it == state->entries.end()) return std::nullopt;
    return it->second.value;
}

auto Transaction::counter(std::string_view container) const -> std::int64_t {
    const auto* state = state_.get_container(std::string{container});
    auto total = state ? state->counter : std::int64_t{0};
    for (const auto& op : pending_ops_) {
        if (op.action == OpType::increment && op.container == container) {
            total += std::get<std::int64_t>(op.value);
        }
    }
    return total;
}

}  // namespace leaf_cpp
