#include "memspace/memory_space.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace memspace {

namespace {

int SumLengths(const std::vector<MemBlock>& blocks) {
    return std::accumulate(
        blocks.begin(), blocks.end(), 0,
        [](int total, const MemBlock& block) { return total + block.length; });
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const MemBlock& block) {
    return os << "(" << block.base_address << " , " << block.length << ")";
}

MemorySpace::MemorySpace(int max_size) : max_size_(max_size) {
    if (max_size_ <= 0) {
        throw std::invalid_argument("max size must be a positive integer");
    }

    /* the entire arena starts out as a single free block */
    free_.push_back({.base_address = 0, .length = max_size_});
}

int MemorySpace::FreeBytes() const { return SumLengths(free_); }

int MemorySpace::AllocatedBytes() const { return SumLengths(allocated_); }

int MemorySpace::LargestFreeBlock() const {
    int largest = 0;
    for (const MemBlock& block : free_) {
        largest = std::max(largest, block.length);
    }
    return largest;
}

int MemorySpace::Malloc(int length) {
    if (length <= 0) {
        throw std::invalid_argument("length must be a positive integer");
    }

    auto curr = free_.begin();
    while (curr != free_.end()) { /* taking a first fit approach */
        if (curr->length >= length) {
            break; /* found a large enough block */
        }
        ++curr;
    }

    if (curr == free_.end()) { /* unable to satisfy request */
        return kAllocFailure;
    }

    const int address = curr->base_address;
    allocated_.push_back({.base_address = address, .length = length});

    /* carve the request off the low end of the free block */
    curr->base_address += length;
    curr->length -= length;
    if (curr->length == 0) { /* free block was entirely consumed */
        free_.erase(curr);
    }

    return address;
}

void MemorySpace::Free(int address) {
    if (allocated_.empty()) {
        throw std::invalid_argument("cannot free a block, no blocks allocated");
    }

    auto block = std::find_if(allocated_.begin(), allocated_.end(),
                              [address](const MemBlock& b) {
                                  return b.base_address == address;
                              });
    if (block == allocated_.end()) {
        return;
    }

    /* released blocks go to the tail of the free list unmerged */
    free_.push_back(*block);
    allocated_.erase(block);
}

void MemorySpace::Defrag() {
    if (free_.size() < 2) {
        return;
    }

    std::sort(free_.begin(), free_.end(),
              [](const MemBlock& a, const MemBlock& b) {
                  return a.base_address < b.base_address;
              });

    /* blocks are sorted and never overlap so one pass is enough, a merged
     * block is compared against its new neighbor before moving on */
    std::size_t i = 0;
    while (i + 1 < free_.size()) {
        MemBlock& curr = free_[i];
        const MemBlock& next = free_[i + 1];
        if (curr.End() == next.base_address) {
            curr.length += next.length;
            free_.erase(free_.begin() + static_cast<std::ptrdiff_t>(i) + 1);
        } else {
            ++i;
        }
    }
}

std::string MemorySpace::RenderBlocks(const std::vector<MemBlock>& blocks) {
    std::ostringstream os;
    for (const MemBlock& block : blocks) {
        os << block << " ";
    }
    return os.str();
}

std::string MemorySpace::ToString() const {
    return RenderBlocks(free_) + "\n" + RenderBlocks(allocated_);
}

void MemorySpace::PrintBlocks() const {
    std::cout << "free:      " << RenderBlocks(free_) << std::endl;
    std::cout << "allocated: " << RenderBlocks(allocated_) << std::endl;
}

std::ostream& operator<<(std::ostream& os, const MemorySpace& space) {
    return os << space.ToString();
}

}  // namespace memspace
