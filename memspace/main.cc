#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "memspace/memory_space.hpp"

int main(int argc, char** argv) {
    constexpr int kDefaultArenaSize = 100;
    constexpr int kBlockLength = 15;

    try {
        std::size_t parsed = 0;
        const int arena_size =
            (argc > 1) ? std::stoi(argv[1], &parsed) : kDefaultArenaSize;
        if (argc > 1 && parsed != std::string(argv[1]).size()) {
            std::cerr << "invalid arena size: " << argv[1] << std::endl;
            return EXIT_FAILURE;
        }

        memspace::MemorySpace space(arena_size);
        space.PrintBlocks();

        std::vector<int> addrs;
        for (int i = 0; i < 5; ++i) {
            const int addr = space.Malloc(kBlockLength);
            std::cout << "addr" << i << " = " << addr << std::endl;
            if (addr != memspace::MemorySpace::kAllocFailure) {
                addrs.push_back(addr);
            }
        }
        space.PrintBlocks();

        /* release every other block to fragment the free list */
        for (std::size_t i = 0; i < addrs.size(); i += 2) {
            space.Free(addrs[i]);
        }
        space.PrintBlocks();

        space.Defrag();
        space.PrintBlocks();
    } catch (const std::exception& e) {
        std::cerr << "memspace_demo: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
