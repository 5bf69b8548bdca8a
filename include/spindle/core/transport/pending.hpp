#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <span>
#include <utility>

#include "spindle/core/transaction.hpp"

namespace spindle::core::transport {

/*
===============================================================================
 transport::Pending
===============================================================================

Lazily consumed sequence of transactions waiting for admission.

The source is pulled one item at a time, only when the engine has room in
its window. A single item of lookahead answers "is anything left?" without
consuming the sequence. A source signals exhaustion by returning nullptr;
it is not called again afterwards.
===============================================================================
*/
class Pending {
public:
    using Source = std::function<Transaction*()>;

    Pending() = default;

    explicit Pending(Source source)
        : source_(std::move(source))
        , done_(!source_)
    {}

    // Walks a caller-owned range of transactions
    static Pending from(std::span<Transaction> txns) {
        return Pending{[txns, i = std::size_t{0}]() mutable -> Transaction* {
            return i < txns.size() ? &txns[i++] : nullptr;
        }};
    }

    // Walks any input range yielding Transaction& (kept alive by the caller)
    template<std::input_iterator It, std::sentinel_for<It> End>
    static Pending from(It first, End last) {
        return Pending{[first, last]() mutable -> Transaction* {
            if (first == last) {
                return nullptr;
            }
            Transaction& txn = *first;
            ++first;
            return &txn;
        }};
    }

    // True once the source returned nullptr and no lookahead remains
    [[nodiscard]] bool exhausted() {
        peek_();
        return lookahead_ == nullptr;
    }

    // Next transaction, or nullptr when exhausted
    [[nodiscard]] Transaction* next() {
        peek_();
        Transaction* txn = std::exchange(lookahead_, nullptr);
        if (txn) {
            ++consumed_;
        }
        return txn;
    }

    [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

private:
    void peek_() {
        if (lookahead_ != nullptr || done_) {
            return;
        }
        lookahead_ = source_();
        if (lookahead_ == nullptr) {
            done_ = true;
        }
    }

private:
    Source source_;
    Transaction* lookahead_{nullptr};
    std::size_t consumed_{0};
    bool done_{true};
};

} // namespace spindle::core::transport
