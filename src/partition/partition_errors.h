#pragma once

#include <stdexcept>
#include <string>

namespace Fleetshard {

/**
 * Base class for fatal partition engine failures.
 * Each instance describes exactly one problem; the engine never aggregates.
 */
class PartitionError : public std::runtime_error {
public:
    explicit PartitionError(const std::string& what) : std::runtime_error(what) {}
};

// A reservation refers to a shard index outside [0, shard_count)
class InvalidReservationError : public PartitionError {
public:
    InvalidReservationError(int shard_index, int shard_count);

    int shard_index() const { return shard_index_; }
    int shard_count() const { return shard_count_; }

private:
    int shard_index_;
    int shard_count_;
};

// The same identifier is pinned to two different shards
class DuplicateReservationError : public PartitionError {
public:
    DuplicateReservationError(const std::string& id, int first_shard, int second_shard);

    const std::string& id() const { return id_; }
    int first_shard() const { return first_shard_; }
    int second_shard() const { return second_shard_; }

private:
    std::string id_;
    int first_shard_;
    int second_shard_;
};

class UnknownStrategyError : public PartitionError {
public:
    explicit UnknownStrategyError(const std::string& strategy);

    const std::string& strategy() const { return strategy_; }

private:
    std::string strategy_;
};

} // namespace Fleetshard
