#ifndef _TRANSPOSITION_H
#define _TRANSPOSITION_H

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <span>
#include <cstdint>

namespace transposition
{

struct grid_location_t
{
    uint32_t x;
    uint32_t y;

    bool operator==(grid_location_t const& other) const = default;
};

using route_t = std::vector<grid_location_t>;

/**
 * A grid of width columns and length rows. Cells may be empty, empty cells are skipped when the rectangle is
 * unravelled.
 */
class rectangle_t
{
  public:
    rectangle_t(uint32_t width, uint32_t length);

    inline uint32_t width() const
    {
        return m_width;
    }

    inline uint32_t length() const
    {
        return m_length;
    }

    std::optional<char> const& at(uint32_t x, uint32_t y) const;
    std::optional<char>& at(uint32_t x, uint32_t y);

    void swap_rows(uint32_t row_1, uint32_t row_2);
    void swap_columns(uint32_t column_1, uint32_t column_2);

    std::string unravel_horizontally() const;
    std::string unravel_vertically() const;

    void write_to_locations(std::string_view text, std::span<const grid_location_t> locations);
    std::string read_from_locations(std::span<const grid_location_t> locations) const;

    std::string to_string() const;

    bool operator==(rectangle_t const& other) const = default;

  private:
    void check_location(uint32_t x, uint32_t y) const;

    uint32_t m_width;
    uint32_t m_length;
    std::vector<std::optional<char>> m_cells;
};

rectangle_t form_rectangle_horizontally(std::string_view text, uint32_t width, uint32_t length);

rectangle_t form_rectangle_vertically(std::string_view text, uint32_t width, uint32_t length);

/**
 * @brief Get the order of cells of a rectangle visited by a spiral.
 *
 * Each ring starts at its top left corner. Clockwise rings continue along the top row, counter-clockwise rings along
 * the left column.
 *
 * @param width the width of the rectangle
 * @param length the length of the rectangle
 * @param clockwise the direction of the spiral
 * @param inward if false, the order of the complete inward spiral is reversed
 *
 * @return every cell of the rectangle exactly once
 */
route_t get_spiral(uint32_t width, uint32_t length, bool clockwise = true, bool inward = true);

rectangle_t form_rectangle_spiral(
    std::string_view text, uint32_t width, uint32_t length, bool clockwise = true, bool inward = true);

struct route_params_t
{
    uint32_t width;
    uint32_t length;
    bool clockwise = true;
    bool inward    = true;
};

/**
 * @brief Route cipher encryption: write the text along the spiral and read the rectangle row by row.
 *
 * The text length must equal width * length.
 */
std::string route_encrypt(std::string_view plaintext, route_params_t const& params);

std::string route_decrypt(std::string_view crypt_text, route_params_t const& params);

} // namespace transposition

#endif /* _TRANSPOSITION_H */
