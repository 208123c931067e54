#include <array>
#include <iostream>
#include <string>
#include <vector>

#include <cstdint>
#include <bindiag.hpp>
#include <spdlog/spdlog.h>

using namespace bindiag;

// A toy image container:
//   magic    "IMG1" or "IMG2"
//   width    u16 little-endian, 1..4096
//   height   u16 little-endian, 1..4096
//   palette  u8 entry count, then count x 3-byte RGB entries
//   pixels   u32 little-endian length, then that many bytes

struct Image {
    uint16_t width;
    uint16_t height;
    std::vector<Input> palette;
    Input pixels;
};

auto dimension(const char* name) {
    return context_fmt(verify(le_u16(), [](uint16_t v) { return v >= 1 && v <= 4096; }),
                       "{} (u16, 1..4096)", name);
}

ParseResult<Image> parse_image(Input input) {
    auto magic = context("magic", alt(tag("IMG1"), tag("IMG2")))(input);
    if (!magic.has_value()) {
        return unexpected(std::move(magic).error());
    }

    auto width = dimension("width")(magic->remaining);
    if (!width.has_value()) {
        return unexpected(std::move(width).error());
    }
    auto height = dimension("height")(width->remaining);
    if (!height.has_value()) {
        return unexpected(std::move(height).error());
    }

    auto entries = context("palette size", u8())(height->remaining);
    if (!entries.has_value()) {
        return unexpected(std::move(entries).error());
    }
    auto palette = context_fmt(count(take(3), entries->value), "palette ({} RGB entries)",
                               entries->value)(entries->remaining);
    if (!palette.has_value()) {
        return unexpected(std::move(palette).error());
    }

    auto pixels = context("pixel data", length_data(le_u32()))(palette->remaining);
    if (!pixels.has_value()) {
        return unexpected(std::move(pixels).error());
    }

    return Parsed<Image>{pixels->remaining,
                         Image{width->value, height->value, std::move(palette->value),
                               pixels->value}};
}

void decode(const std::string& title, Input input, const RenderOptions& options = {}) {
    std::cout << title << "\n";
    std::cout << std::string(title.size(), '-') << "\n";

    auto image = context("image file", all_consuming(parse_image))(input);
    if (image.has_value()) {
        std::cout << "  " << image->value.width << "x" << image->value.height << ", "
                  << image->value.palette.size() << " palette entries, "
                  << image->value.pixels.size() << " pixel bytes\n\n";
        return;
    }

    std::cout << render_trace(input, image.error().trace, options) << "\n";
}

int main() {
    std::cout << "BINDIAG Trace Examples\n";
    std::cout << "======================\n\n";

    // Example 1: a well-formed file
    std::array<uint8_t, 19> good{'I', 'M', 'G', '2', 0x02, 0x00, 0x01, 0x00, 0x02, 0xFF,
                                 0x00, 0x00, 0x00, 0x00, 0xFF, 0x02, 0x00, 0x00, 0x00};
    std::vector<uint8_t> good_with_pixels(good.begin(), good.end());
    good_with_pixels.push_back(0x00);
    good_with_pixels.push_back(0x01);
    decode("1. Well-formed file", good_with_pixels);

    // Example 2: the second palette entry is cut short
    std::array<uint8_t, 14> truncated{'I', 'M', 'G', '1', 0x10, 0x00, 0x10,
                                      0x00, 0x02, 0xFF, 0x00, 0x00, 0x00, 0x00};
    decode("2. Truncated palette", truncated);

    // Example 3: a height of zero, with raw classifier entries shown too
    std::array<uint8_t, 8> zero_height{'I', 'M', 'G', '1', 0x10, 0x00, 0x00, 0x00};
    decode("3. Invalid height (raw kinds shown)", zero_height,
           RenderOptions{.show_raw_kinds = true});

    // Example 4: an empty file
    decode("4. Empty file", Input{});

    // Example 5: let the library log the failure itself
    std::cout << "5. Logged report\n";
    std::cout << "----------------\n";
    spdlog::set_level(spdlog::level::debug);
    auto unknown = context("image file", parse_image)(Input{zero_height}.first(3));
    if (!unknown.has_value()) {
        report_failure(Input{zero_height}.first(3), unknown.error());
    }

    return 0;
}
