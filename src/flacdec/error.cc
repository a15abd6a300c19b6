// This is copyrighted software. More information is at the end of this file.
#include <flacdec/error.hh>

namespace flacdec {

    namespace {
        std::string hex16(uint16_t value) {
            static constexpr char digits[] = "0123456789ABCDEF";
            std::string out = "0x";
            for (int shift = 12; shift >= 0; shift -= 4) {
                out += digits[(value >> shift) & 0xF];
            }
            return out;
        }

        std::string crc_message(uint16_t expected, uint16_t computed) {
            return "Frame CRC-16 mismatch: stored " + hex16(expected) + ", computed " + hex16(computed);
        }
    }

    integrity_error::integrity_error(uint16_t expected, uint16_t computed)
        : flacdec_error(crc_message(expected, computed))
        , m_expected(expected)
        , m_computed(computed) {
    }

} // namespace flacdec

/*
 * Copyright (C) 2025
 *
 * This file is part of flacdec.
 *
 * flacdec is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * flacdec is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with flacdec.  If not, see <http://www.gnu.org/licenses/>.
 */
