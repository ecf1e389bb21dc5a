#include "transposition.h"
#include "except.h"
#include <algorithm>
#include <format>

namespace transposition
{

namespace
{

void ensure_valid_geometry(uint32_t width, uint32_t length)
{
    if (width == 0 || length == 0)
    {
        throw invalid_argument_exception_t(std::format("invalid rectangle geometry {}x{}", width, length));
    }
}

void ensure_text_fills_rectangle(std::string_view text, route_params_t const& params)
{
    size_t cell_count = static_cast<size_t>(params.width) * params.length;
    if (text.size() != cell_count)
    {
        throw invalid_argument_exception_t(std::format(
            "text length {} does not match the {} cells of the {}x{} route rectangle", text.size(), cell_count,
            params.width, params.length));
    }
}

/**
 * The cells of one ring of the spiral in clockwise order, starting at the top left corner of the ring.
 */
route_t clockwise_ring(uint32_t left, uint32_t right, uint32_t top, uint32_t bottom)
{
    route_t ring;
    for (uint32_t x = left; x <= right; x++)
    {
        ring.push_back({.x = x, .y = top});
    }
    for (uint32_t y = top + 1; y <= bottom; y++)
    {
        ring.push_back({.x = right, .y = y});
    }
    if (top < bottom)
    {
        for (uint32_t x = right; x > left; x--)
        {
            ring.push_back({.x = x - 1, .y = bottom});
        }
    }
    if (left < right && top < bottom)
    {
        for (uint32_t y = bottom - 1; y > top; y--)
        {
            ring.push_back({.x = left, .y = y});
        }
    }
    return ring;
}

} // namespace

rectangle_t::rectangle_t(uint32_t width, uint32_t length)
    : m_width(width), m_length(length), m_cells(static_cast<size_t>(width) * length)
{
    ensure_valid_geometry(width, length);
}

void rectangle_t::check_location(uint32_t x, uint32_t y) const
{
    if (x >= m_width || y >= m_length)
    {
        throw invalid_argument_exception_t(
            std::format("location ({}, {}) outside of the {}x{} rectangle", x, y, m_width, m_length));
    }
}

std::optional<char> const& rectangle_t::at(uint32_t x, uint32_t y) const
{
    check_location(x, y);
    return m_cells[static_cast<size_t>(y) * m_width + x];
}

std::optional<char>& rectangle_t::at(uint32_t x, uint32_t y)
{
    check_location(x, y);
    return m_cells[static_cast<size_t>(y) * m_width + x];
}

void rectangle_t::swap_rows(uint32_t row_1, uint32_t row_2)
{
    check_location(0, row_1);
    check_location(0, row_2);
    for (uint32_t x = 0; x < m_width; x++)
    {
        std::swap(at(x, row_1), at(x, row_2));
    }
}

void rectangle_t::swap_columns(uint32_t column_1, uint32_t column_2)
{
    check_location(column_1, 0);
    check_location(column_2, 0);
    for (uint32_t y = 0; y < m_length; y++)
    {
        std::swap(at(column_1, y), at(column_2, y));
    }
}

std::string rectangle_t::unravel_horizontally() const
{
    std::string text;
    for (auto const& cell : m_cells)
    {
        if (cell.has_value())
        {
            text.push_back(cell.value());
        }
    }
    return text;
}

std::string rectangle_t::unravel_vertically() const
{
    std::string text;
    for (uint32_t x = 0; x < m_width; x++)
    {
        for (uint32_t y = 0; y < m_length; y++)
        {
            if (at(x, y).has_value())
            {
                text.push_back(at(x, y).value());
            }
        }
    }
    return text;
}

void rectangle_t::write_to_locations(std::string_view text, std::span<const grid_location_t> locations)
{
    for (size_t i = 0; i < locations.size() && i < text.size(); i++)
    {
        at(locations[i].x, locations[i].y) = text[i];
    }
}

std::string rectangle_t::read_from_locations(std::span<const grid_location_t> locations) const
{
    std::string text;
    for (auto const& loc : locations)
    {
        if (at(loc.x, loc.y).has_value())
        {
            text.push_back(at(loc.x, loc.y).value());
        }
    }
    return text;
}

std::string rectangle_t::to_string() const
{
    std::string result;
    for (uint32_t y = 0; y < m_length; y++)
    {
        for (uint32_t x = 0; x < m_width; x++)
        {
            result.push_back(at(x, y).value_or('.'));
        }
        result.push_back('\n');
    }
    return result;
}

rectangle_t form_rectangle_horizontally(std::string_view text, uint32_t width, uint32_t length)
{
    rectangle_t rectangle(width, length);
    for (size_t i = 0; i < text.size() && i < static_cast<size_t>(width) * length; i++)
    {
        rectangle.at(static_cast<uint32_t>(i % width), static_cast<uint32_t>(i / width)) = text[i];
    }
    return rectangle;
}

rectangle_t form_rectangle_vertically(std::string_view text, uint32_t width, uint32_t length)
{
    rectangle_t rectangle(width, length);
    for (size_t i = 0; i < text.size() && i < static_cast<size_t>(width) * length; i++)
    {
        rectangle.at(static_cast<uint32_t>(i / length), static_cast<uint32_t>(i % length)) = text[i];
    }
    return rectangle;
}

route_t get_spiral(uint32_t width, uint32_t length, bool clockwise, bool inward)
{
    ensure_valid_geometry(width, length);
    route_t locations;
    for (uint32_t ring_idx = 0; 2 * ring_idx < width && 2 * ring_idx < length; ring_idx++)
    {
        route_t ring = clockwise_ring(ring_idx, width - ring_idx - 1, ring_idx, length - ring_idx - 1);
        if (!clockwise && ring.size() > 1)
        {
            // same starting cell, the rest of the ring in reverse order
            std::reverse(ring.begin() + 1, ring.end());
        }
        locations.insert(locations.end(), ring.begin(), ring.end());
    }
    if (!inward)
    {
        std::reverse(locations.begin(), locations.end());
    }
    return locations;
}

rectangle_t form_rectangle_spiral(std::string_view text, uint32_t width, uint32_t length, bool clockwise, bool inward)
{
    rectangle_t rectangle(width, length);
    rectangle.write_to_locations(text, get_spiral(width, length, clockwise, inward));
    return rectangle;
}

std::string route_encrypt(std::string_view plaintext, route_params_t const& params)
{
    ensure_valid_geometry(params.width, params.length);
    ensure_text_fills_rectangle(plaintext, params);
    return form_rectangle_spiral(plaintext, params.width, params.length, params.clockwise, params.inward)
        .unravel_horizontally();
}

std::string route_decrypt(std::string_view crypt_text, route_params_t const& params)
{
    ensure_valid_geometry(params.width, params.length);
    ensure_text_fills_rectangle(crypt_text, params);
    rectangle_t rectangle = form_rectangle_horizontally(crypt_text, params.width, params.length);
    return rectangle.read_from_locations(get_spiral(params.width, params.length, params.clockwise, params.inward));
}

} // namespace transposition
