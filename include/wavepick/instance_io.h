#pragma once
/*
===============================================================================
INSTANCE IO — Challenge text format for instances and solutions
===============================================================================

Instance format
---------------
    nOrders nItems nAisles
    k  item_1 qty_1 ... item_k qty_k       (one line per order)
    k  item_1 qty_1 ... item_k qty_k       (one line per aisle)
    waveSizeLB waveSizeUB

A repeated item on one line adds up. Reading stops at the bound line; the
Instance constructor validates ids and bounds.

Solution format
---------------
    number of selected orders
    one order id per line
    number of visited aisles
    one aisle id per line

EXCEPTION SAFETY
----------------
• Malformed input throws std::runtime_error naming the line
• Unreadable or unwritable files throw std::runtime_error
• Invalid instance data throws std::invalid_argument (from Instance)

===============================================================================
*/

#include <istream>
#include <ostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>

#include <fmt/format.h>

#include "instance.h"
#include "solution.h"

namespace wavepick {

    namespace io_detail {

        class LineReader {
        private:
            std::istream& in_;
            int line_ = 0;

        public:
            explicit LineReader(std::istream& in) : in_(in) {}

            /// @brief Next non-blank line as a stream; throws at end of input
            std::istringstream next(const char* what)
            {
                std::string text;
                while (std::getline(in_, text)) {
                    ++line_;
                    if (text.find_first_not_of(" \t\r") != std::string::npos)
                        return std::istringstream(text);
                }
                throw std::runtime_error(fmt::format(
                    "readInstance: unexpected end of input, expected {} after line {}", what, line_));
            }

            int line() const noexcept { return line_; }
        };

        template <typename T>
        T readField(std::istringstream& ss, const LineReader& r, const char* what)
        {
            T v{};
            if (!(ss >> v)) {
                throw std::runtime_error(fmt::format(
                    "readInstance: line {}: expected {}", r.line(), what));
            }
            return v;
        }

        inline ItemQuantities readEntry(LineReader& r, const char* kind)
        {
            auto ss = r.next(kind);
            const int k = readField<int>(ss, r, "entry count");
            if (k < 0)
                throw std::runtime_error(fmt::format(
                    "readInstance: line {}: negative entry count {}", r.line(), k));

            ItemQuantities q;
            for (int e = 0; e < k; ++e) {
                const int item = readField<int>(ss, r, "item id");
                const int qty = readField<int>(ss, r, "quantity");
                q[item] += qty;
            }
            return q;
        }

    } // namespace io_detail

    inline Instance readInstance(std::istream& in)
    {
        io_detail::LineReader r(in);

        auto header = r.next("header");
        const int nOrders = io_detail::readField<int>(header, r, "order count");
        const int nItems = io_detail::readField<int>(header, r, "item count");
        const int nAisles = io_detail::readField<int>(header, r, "aisle count");
        if (nOrders < 0 || nAisles < 0)
            throw std::runtime_error(fmt::format(
                "readInstance: negative counts in header ({} orders, {} aisles)", nOrders, nAisles));

        std::vector<ItemQuantities> orders;
        orders.reserve(static_cast<std::size_t>(nOrders));
        for (int o = 0; o < nOrders; ++o)
            orders.push_back(io_detail::readEntry(r, "order line"));

        std::vector<ItemQuantities> aisles;
        aisles.reserve(static_cast<std::size_t>(nAisles));
        for (int a = 0; a < nAisles; ++a)
            aisles.push_back(io_detail::readEntry(r, "aisle line"));

        auto bounds = r.next("wave bounds");
        const int lb = io_detail::readField<int>(bounds, r, "wave size lower bound");
        const int ub = io_detail::readField<int>(bounds, r, "wave size upper bound");

        return Instance(std::move(orders), std::move(aisles), nItems, lb, ub);
    }

    inline Instance readInstanceFile(const std::string& path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error(fmt::format("readInstanceFile: cannot open '{}'", path));
        return readInstance(in);
    }

    inline void writeSolution(std::ostream& out, const Solution& sol)
    {
        out << sol.orders.size() << '\n';
        for (int o : sol.orders)
            out << o << '\n';
        out << sol.aisles.size() << '\n';
        for (int a : sol.aisles)
            out << a << '\n';
    }

    inline void writeSolutionFile(const std::string& path, const Solution& sol)
    {
        std::ofstream out(path);
        if (!out)
            throw std::runtime_error(fmt::format("writeSolutionFile: cannot open '{}'", path));
        writeSolution(out, sol);
        if (!out)
            throw std::runtime_error(fmt::format("writeSolutionFile: write to '{}' failed", path));
    }

} // namespace wavepick
