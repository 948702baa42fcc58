// Standalone fuzz driver for replaying inputs when libFuzzer is not available
// Each argument is an input file; every file is fed to the target once

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file> [input_file...]\n", argv[0]);
        fprintf(stderr, "\nReplays corpus files through the fuzz target.\n");
        fprintf(stderr, "Configure with a libFuzzer-capable clang for real fuzzing.\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            return 1;
        }

        std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());

        printf("Replaying %s (%zu bytes)\n", argv[i], buffer.size());
        LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    }

    printf("Replayed %d input(s)\n", argc - 1);
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
