#include <iostream>
#include <string>

#include <mnist/mnist.hpp>

// Downloads the dataset into a local directory (default "mnist-data"),
// prints the size of every collection and renders the first training image.

int main(int argc, char** argv) {
    std::string save_dir = argc >= 2 ? argv[1] : "mnist-data";

    mnist::MnistReader mnist(save_dir);
    try {
        mnist.load();
    } catch (const mnist::LoadError& e) {
        std::cerr << "load failed (" << mnist::to_string(e.kind()) << "): " << e.what() << '\n';
        return 1;
    }

    std::cout << "Train data size: " << mnist.train_images.size() << '\n';
    std::cout << "Test data size: " << mnist.test_images.size() << '\n';
    std::cout << "Train labels size: " << mnist.train_labels.size() << '\n';
    std::cout << "Test labels size: " << mnist.test_labels.size() << '\n';
    if (mnist.train_images.empty() || mnist.train_labels.empty())
        return 0;

    const mnist::Image& first = mnist.train_images[0];
    std::cout << "images[0]=[";
    for (std::size_t i = 0; i < first.size(); ++i)
        std::cout << (i ? ", " : "") << first[i];
    std::cout << "]\n";
    mnist::print_image(first);
    std::cout << "labels[0]=" << static_cast<unsigned>(mnist.train_labels[0]) << std::endl;
    return 0;
}
