#pragma once

#include <atomic>
#include <memory>
#include "schema/table_schema.hpp"

namespace tabula {

/**
 * @brief Slot holding the latest published schema. One writer replaces the whole value,
 * readers load it without locking and always see either the old or the new schema.
 */
class SchemaPublisher {
public:
    SchemaPublisher() = default;

    explicit SchemaPublisher(SchemaPtr initial) : current_(std::move(initial)) {}

    SchemaPublisher(const SchemaPublisher&) = delete;
    SchemaPublisher& operator=(const SchemaPublisher&) = delete;

    SchemaPtr load() const noexcept { return current_.load(std::memory_order_acquire); }

    void store(SchemaPtr schema) noexcept { current_.store(std::move(schema), std::memory_order_release); }

private:
    std::atomic<SchemaPtr> current_;
};

}  // namespace tabula
