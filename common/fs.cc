/*
    Copyright (C) 1996-1997  Id Software, Inc.
    Copyright (C) 1997       Greg Lewis

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA

    See file, 'COPYING', for details.
*/

#include "common/fs.hh"
#include "common/log.hh"
#include <fstream>

namespace fs
{
data load(const path &p)
{
    std::error_code ec;

    if (!is_regular_file(p, ec)) {
        return std::nullopt;
    }

    try {
        uintmax_t size = file_size(p);
        std::ifstream stream(p, std::ios_base::in | std::ios_base::binary);

        if (!stream) {
            return std::nullopt;
        }

        std::vector<uint8_t> data(size);
        stream.read(reinterpret_cast<char *>(data.data()), size);

        if (static_cast<uintmax_t>(stream.gcount()) != size) {
            logging::funcprint("WARNING: short read on {}\n", p);
            data.resize(stream.gcount());
        }

        return data;
    } catch (const filesystem_error &e) {
        logging::funcprint("WARNING: {}\n", e.what());
        return std::nullopt;
    }
}

std::string_view as_text(const data &d)
{
    Q_assert(d.has_value());

    return std::string_view(reinterpret_cast<const char *>(d->data()), d->size());
}
} // namespace fs

fs::path DefaultExtension(const fs::path &path, const fs::path &extension)
{
    if (path.has_extension())
        return path;

    return fs::path(path).replace_extension(extension);
}
