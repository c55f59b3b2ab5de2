#ifndef DAGSYNC_DAG_BLOCK_SINK_HPP
#define DAGSYNC_DAG_BLOCK_SINK_HPP

#include <map>
#include <mutex>
#include <vector>
#include "dag/cid.hpp"

namespace dagsync::dag {

// A finalized node: its CID and canonical bytes
struct Block {
    Cid cid;
    Bytes data;
};

// Consumer of finalized blocks, fed bottom-up by the DAG builder
class BlockSink {
public:
    virtual ~BlockSink() = default;

    // Takes ownership of the block. May return before the block is acknowledged.
    virtual void put(Block block) = 0;

    // Returns once every block put so far is acknowledged, rethrowing the first
    // failure. The builder calls this before emitting any parent node.
    virtual void drain() {}

protected:
    BlockSink() = default;
};

// Discards blocks; used to compute CIDs without transferring anything
class NullSink : public BlockSink {
public:
    void put(Block block) override {
        ++count_;
        bytes_ += block.data.size();
    }

    std::size_t count() const { return count_; }
    std::size_t bytes() const { return bytes_; }

private:
    std::size_t count_{0};
    std::size_t bytes_{0};
};

// Keeps every block in memory, in emission order
class CollectingSink : public BlockSink {
public:
    void put(Block block) override {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.push_back(block.cid);
        blocks_[block.cid] = std::move(block.data);
    }

    bool has(const Cid& cid) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blocks_.count(cid) > 0;
    }

    const Bytes& get(const Cid& cid) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blocks_.at(cid);
    }

    // CIDs in the order they were put, duplicates included
    const std::vector<Cid>& order() const { return order_; }
    std::size_t unique_count() const { return blocks_.size(); }

private:
    mutable std::mutex mutex_;
    std::map<Cid, Bytes> blocks_;
    std::vector<Cid> order_;
};

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_BLOCK_SINK_HPP
