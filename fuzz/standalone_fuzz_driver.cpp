// Standalone driver for fuzz targets when libFuzzer is not available
// Replays corpus files through the target so crashes found elsewhere can be
// reproduced with a regular toolchain.

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
        fprintf(stderr, "\nReplays each file through the fuzz target once.\n");
        fprintf(stderr, "For coverage-guided fuzzing, build with clang and -fsanitize=fuzzer.\n");
        return 1;
    }

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            ++failures;
            continue;
        }

        std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());

        printf("Replaying %s (%zu bytes)\n", argv[i], buffer.size());
        LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    }

    printf("Replayed %d input(s), %d unreadable\n", argc - 1, failures);
    return failures == 0 ? 0 : 1;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
