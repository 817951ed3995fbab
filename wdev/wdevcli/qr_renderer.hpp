/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file qr_renderer.hpp
 * @brief Renders QR codes for the terminal with libqrencode
 **/

#ifndef _WDEV_QR_RENDERER_HPP_
#define _WDEV_QR_RENDERER_HPP_

#include "wdevcli.hpp"

#include <string>
#include <vector>

// Light modules around the symbol, in modules
#define WDEV_QR_QUIET_ZONE (2)

class QrRenderer final
{
public:
    QrRenderer() = delete;

    // adbwireless://address:port
    static std::string build_connection_uri(const std::string &address, uint16_t port);

    /**
     * Encodes text and draws it for a dark terminal background, two module rows per line.
     *
     * @return The drawing, without a trailing newline. WDEV_INVALID_ARGUMENT if text does not fit a QR code,
     *         WDEV_OUT_OF_HOST_MEMORY if encoding could not allocate.
     */
    static Expected<std::string> render(const std::string &text);

    /**
     * Draws a square matrix given row by row (true for a dark module) with a light quiet zone.
     * Light modules are drawn as blocks, so the terminal background shows the dark ones.
     */
    static std::string draw_modules(const std::vector<bool> &dark_modules, size_t width);
};

#endif /* _WDEV_QR_RENDERER_HPP_ */
