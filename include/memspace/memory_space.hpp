#ifndef MEMORY_SPACE_HPP_
#define MEMORY_SPACE_HPP_

#include <ostream>
#include <string>
#include <vector>

namespace memspace {

/* a contiguous address range [base_address, base_address + length) */
struct MemBlock {
    int base_address = 0;
    int length = 0;

    int End() const { return base_address + length; }

    bool operator==(const MemBlock&) const = default;
};

std::ostream& operator<<(std::ostream& os, const MemBlock& block);

class MemorySpace {
   public:
    static constexpr int kAllocFailure = -1;

    explicit MemorySpace(int max_size);

    int MaxSize() const { return max_size_; }
    const std::vector<MemBlock>& FreeBlocks() const { return free_; }
    const std::vector<MemBlock>& AllocatedBlocks() const { return allocated_; }

    int FreeBytes() const;
    int AllocatedBytes() const;
    int LargestFreeBlock() const;

    /* first fit, returns kAllocFailure when no single free block is large
     * enough */
    int Malloc(int length);

    /* throws std::invalid_argument when no blocks are allocated, an address
     * that matches no allocated block is ignored */
    void Free(int address);

    /* sorts the free list by address and merges adjacent blocks */
    void Defrag();

    std::string ToString() const;
    void PrintBlocks() const;

   private:
    static std::string RenderBlocks(const std::vector<MemBlock>& blocks);

    int max_size_;
    std::vector<MemBlock> free_;
    std::vector<MemBlock> allocated_;
};

std::ostream& operator<<(std::ostream& os, const MemorySpace& space);

}  // namespace memspace

#endif
