#pragma once

/**
 * @file reader.hpp
 * @brief In-memory MNIST dataset populated from a local archive cache.
 *
 * @code
 * mnist::MnistReader mnist("mnist-data");
 * mnist.load();
 * std::cout << mnist.train_images.size() << " training images\n";
 * mnist::print_image(mnist.train_images[0]);
 * @endcode
 */

#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "mnist/compression.hpp"
#include "mnist/errors.hpp"
#include "mnist/fetcher.hpp"
#include "mnist/idx.hpp"

namespace mnist {

/// Progress of @ref MnistReader::load.
enum class LoadState { Unloaded, FilesEnsured, TrainLoaded, FullyLoaded };

inline const char* to_string(LoadState state) {
    switch (state) {
    case LoadState::Unloaded:
        return "unloaded";
    case LoadState::FilesEnsured:
        return "files-ensured";
    case LoadState::TrainLoaded:
        return "train-loaded";
    case LoadState::FullyLoaded:
        return "fully-loaded";
    }
    return "unknown";
}

/// The two halves of the dataset. Test archives use the `t10k` prefix.
enum class Split { Train, Test };

inline const char* file_prefix(Split split) { return split == Split::Train ? "train" : "t10k"; }

/**
 * @brief Container holding both splits of the dataset.
 *
 * The collections are public so callers can move them out once loading has
 * finished. Image `i` of a split is labelled by label `i` of the same split.
 */
class MnistReader {
  public:
    std::vector<Label> train_labels{};
    std::vector<Image> train_images{};
    std::vector<Label> test_labels{};
    std::vector<Image> test_images{};

    /// Base URL the archives are fetched from.
    std::string mnist_url{kDefaultMnistUrl};
    /// Directory caching the downloaded archives.
    std::string save_dir{};

    explicit MnistReader(std::string dir, std::ostream* log = &std::cout)
        : save_dir{std::move(dir)}, log_{log} {}

    /// Download any archive missing from @p dir. Returns the number fetched.
    static std::size_t download_files(const std::string& dir, const std::string& url,
                                      std::ostream* log = &std::cout) {
        return mnist::download_files(dir, url, log);
    }

    /**
     * @brief Fetch missing archives and decode both splits.
     *
     * Errors propagate unchanged. Collections decoded before the failure
     * are kept and @ref state reports how far loading got.
     */
    void load() {
        state_ = LoadState::Unloaded;
        download_files(save_dir, mnist_url, log_);
        state_ = LoadState::FilesEnsured;
        load_split(Split::Train);
        state_ = LoadState::TrainLoaded;
        load_split(Split::Test);
        state_ = LoadState::FullyLoaded;
    }

    /// Decompress and decode the archives of one split from @ref save_dir.
    /// A split whose label and image counts differ is rejected as corrupt.
    void load_split(Split split) {
        std::string prefix = save_dir + "/" + file_prefix(split);
        auto labels = decode_labels(read_archive(prefix + "-labels-idx1-ubyte.gz"));
        auto images = decode_images(read_archive(prefix + "-images-idx3-ubyte.gz"));
        if (labels.size() != images.size())
            throw LoadError(ErrorKind::Corrupt, std::string(file_prefix(split)) + " split has " +
                                                    std::to_string(labels.size()) +
                                                    " labels but " +
                                                    std::to_string(images.size()) + " images");
        if (split == Split::Train) {
            train_labels = std::move(labels);
            train_images = std::move(images);
        } else {
            test_labels = std::move(labels);
            test_images = std::move(images);
        }
    }

    LoadState state() const { return state_; }

    void set_log(std::ostream* log) { log_ = log; }

  private:
    std::ostream* log_{nullptr};
    LoadState state_{LoadState::Unloaded};
};

} // namespace mnist
