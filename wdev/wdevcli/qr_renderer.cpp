/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file qr_renderer.cpp
 * @brief Renders QR codes for the terminal with libqrencode
 **/

#include "qr_renderer.hpp"
#include "common/network_utils.hpp"

#include <qrencode.h>

#include <errno.h>
#include <memory>

static const char *FULL_BLOCK = "█";
static const char *UPPER_HALF_BLOCK = "▀";
static const char *LOWER_HALF_BLOCK = "▄";
static const char *EMPTY_CELL = " ";

// Any version that fits, lowest error correction for the smallest symbol
static const int AUTO_VERSION = 0;
static const int CASE_SENSITIVE = 1;

using QrCodePtr = std::unique_ptr<QRcode, decltype(&QRcode_free)>;

std::string QrRenderer::build_connection_uri(const std::string &address, uint16_t port)
{
    return fmt::format("{}://{}", WDEV_CONNECTION_URI_SCHEME, NetworkUtils::make_endpoint(address, port));
}

Expected<std::string> QrRenderer::render(const std::string &text)
{
    QrCodePtr qr_code(QRcode_encodeString(text.c_str(), AUTO_VERSION, QR_ECLEVEL_L, QR_MODE_8, CASE_SENSITIVE),
        QRcode_free);
    if (nullptr == qr_code) {
        const auto encode_errno = errno;
        LOGGER__ERROR("Failed encoding \"{}\" as a QR code, errno={}", text, encode_errno);
        return make_unexpected((ENOMEM == encode_errno) ? WDEV_OUT_OF_HOST_MEMORY : WDEV_INVALID_ARGUMENT);
    }

    const auto width = static_cast<size_t>(qr_code->width);
    std::vector<bool> dark_modules(width * width);
    for (size_t i = 0; i < dark_modules.size(); i++) {
        // The lowest bit of each module byte is its color, the others describe its role
        dark_modules[i] = (0 != (qr_code->data[i] & 0x01));
    }
    LOGGER__DEBUG("Encoded \"{}\" as a version {} QR code of {}x{} modules", text, qr_code->version, width, width);

    return draw_modules(dark_modules, width);
}

std::string QrRenderer::draw_modules(const std::vector<bool> &dark_modules, size_t width)
{
    const auto size = width + (2 * WDEV_QR_QUIET_ZONE);
    // Outside the symbol everything is quiet zone, past the last row is terminal background
    const auto is_light = [&](size_t row, size_t column) {
        if (row >= size) {
            return false;
        }
        if ((row < WDEV_QR_QUIET_ZONE) || (column < WDEV_QR_QUIET_ZONE) ||
            (row >= width + WDEV_QR_QUIET_ZONE) || (column >= width + WDEV_QR_QUIET_ZONE)) {
            return true;
        }
        return !dark_modules[((row - WDEV_QR_QUIET_ZONE) * width) + (column - WDEV_QR_QUIET_ZONE)];
    };

    std::string drawing;
    for (size_t row = 0; row < size; row += 2) {
        if (0 != row) {
            drawing += "\n";
        }
        for (size_t column = 0; column < size; column++) {
            const auto top = is_light(row, column);
            const auto bottom = is_light(row + 1, column);
            if (top && bottom) {
                drawing += FULL_BLOCK;
            } else if (top) {
                drawing += UPPER_HALF_BLOCK;
            } else if (bottom) {
                drawing += LOWER_HALF_BLOCK;
            } else {
                drawing += EMPTY_CELL;
            }
        }
    }
    return drawing;
}
