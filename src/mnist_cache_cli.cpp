#include <cstddef>
#include <iostream>
#include <string>

#include <mnist/mnist.hpp>

// ---------------------------------------------------------------------------
// Archive cache CLI
// ---------------------------------------------------------------------------
// Small maintenance tool for the local archive cache. It can populate a cache
// directory, inflate a single archive for inspection with other tools and
// render one decoded digit from a populated cache. Failures surface as the
// loader's exceptions and are reported with their error kind.
// ---------------------------------------------------------------------------

namespace {

void usage() {
    std::cerr << "Usage:\n"
              << "  mnist_cache_cli fetch <dir> [url]\n"
              << "  mnist_cache_cli ungzip <in.gz> <out>\n"
              << "  mnist_cache_cli show <dir> <train|test> <index>\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string cmd = argv[1];

    try {
        if (cmd == "fetch" && argc >= 3) {
            std::string url = argc >= 4 ? argv[3] : mnist::kDefaultMnistUrl;
            std::size_t n = mnist::download_files(argv[2], url, &std::cout);
            std::cout << n << " archive(s) downloaded" << std::endl;
            return 0;
        }
        if (cmd == "ungzip" && argc >= 4) {
            mnist::ungzip(argv[2], argv[3]);
            return 0;
        }
        if (cmd == "show" && argc >= 5) {
            std::string split = argv[3];
            if (split != "train" && split != "test") {
                usage();
                return 1;
            }
            // Only decode the requested split; nothing is downloaded here.
            mnist::MnistReader reader(argv[2], nullptr);
            reader.load_split(split == "train" ? mnist::Split::Train : mnist::Split::Test);
            const auto& images = split == "train" ? reader.train_images : reader.test_images;
            const auto& labels = split == "train" ? reader.train_labels : reader.test_labels;
            std::size_t index = static_cast<std::size_t>(std::stoul(argv[4]));
            if (index >= images.size() || index >= labels.size()) {
                std::cerr << "index " << index << " out of range (" << images.size()
                          << " images)\n";
                return 1;
            }
            mnist::print_image(images[index]);
            std::cout << "label " << static_cast<unsigned>(labels[index]) << std::endl;
            return 0;
        }
    } catch (const mnist::LoadError& e) {
        std::cerr << mnist::to_string(e.kind()) << " error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }

    usage();
    return 1;
}
