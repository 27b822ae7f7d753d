// Decode a token URI and print the metadata document and its embedded card
// Usage: token_uri_inspect 'data:application/json;base64,...'

#include <ChainBattles/data_uri.hpp>
#include <ChainBattles/error_formatting.hpp>
#include <iostream>
#include <string>
#include <string_view>

using namespace ChainBattles;

namespace {

// Value of the "image" member; the base64 envelope never contains a quote.
std::string_view image_field(std::string_view json) {
    constexpr std::string_view field = R"("image":")";
    const auto start = json.find(field);
    if (start == std::string_view::npos) {
        return {};
    }
    json.remove_prefix(start + field.size());
    return json.substr(0, json.find('"'));
}

}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <token uri>" << std::endl;
        return 2;
    }

    std::string json;
    if (auto res = JsonDataUri::Decode(argv[1], json); !res) {
        std::cerr << "token uri: " << DataUriResultToString(res) << std::endl;
        return 1;
    }
    std::cout << json << std::endl;

    const auto image = image_field(json);
    if (image.empty()) {
        std::cerr << "metadata has no image" << std::endl;
        return 1;
    }
    std::string svg;
    if (auto res = SvgDataUri::Decode(image, svg); !res) {
        std::cerr << "image: " << DataUriResultToString(res) << std::endl;
        return 1;
    }
    std::cout << svg << std::endl;
    return 0;
}
