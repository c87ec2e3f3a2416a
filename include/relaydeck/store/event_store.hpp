#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "relaydeck/data/data.hpp"

namespace relaydeck
{
namespace store
{
/**
 * @brief Thrown when the local store cannot complete an operation.
 */
class StoreError : public std::runtime_error
{
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) { };
};

/**
 * @brief A finite cursor over the results of a store query.
 */
class IEventCursor
{
public:
    virtual ~IEventCursor() = default;

    /**
     * @brief Advances the cursor.
     * @param event Receives the next matching event.
     * @returns False once the results are exhausted.
     */
    virtual bool next(std::shared_ptr<const data::Event>& event) = 0;

    /**
     * @brief Rewinds the cursor to its first result.
     */
    virtual void reset() = 0;
};

/**
 * @brief An interface for the local event store the pool persists ingested events to.
 * @remark Implementations must tolerate `put` and `query` being called from different threads.
 */
class IEventStore
{
public:
    virtual ~IEventStore() = default;

    /**
     * @brief Stores an event.
     * @remark Storing an event whose ID is already present has no effect.
     * @throws `StoreError` if the event could not be stored.
     */
    virtual void put(const data::Event& event) = 0;

    /**
     * @brief Finds the stored events matching the given filter.
     * @remark A filter `limit` bounds the number of results.
     * @throws `StoreError` if the store cannot be read.
     */
    virtual std::unique_ptr<IEventCursor> query(const data::Filter& filter) = 0;
};
} // namespace store
} // namespace relaydeck
