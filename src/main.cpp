#include "bloom.hpp"
#include <iostream>

int main() {
    const std::string path = "filter.bloom";

    {
        BloomFilter filter;
        filter.add("googlesy");
        filter.add("doubleclick");
        filter.add("adservice");
        filter.save(path);

        std::cout << "bits: " << filter.bit_count()
                  << " load: " << filter.load_factor() << "\n";
    }

    {
        auto filter = BloomFilter::load(path);
        if (!filter) {
            std::cout << "<missing " << path << ">\n";
            return 1;
        }

        const std::string url =
            "http://tpc.googlesyndication.com/safeframe/1-0-2/html/container.html";
        std::cout << "adservice: " << (filter->exists("adservice") ? "maybe" : "no") << "\n";
        std::cout << "tracker: " << (filter->exists("tracker") ? "maybe" : "no") << "\n";
        std::cout << "url: " << (filter->substring_exists(url, 8) ? "maybe" : "no") << "\n";
    }

    return 0;
}
