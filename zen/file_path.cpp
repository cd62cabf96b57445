// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_path.h"
#include <cassert>
#include <cstdlib>

using namespace zen;


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    if (itemPath.empty())
        return std::nullopt;

    const Zstring trimmed = endsWith(itemPath, FILE_NAME_SEPARATOR) && itemPath.size() > 1 ?
                            itemPath.substr(0, itemPath.size() - 1) : itemPath;

    const size_t pos = trimmed.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return Zstring(); //relative single-component path => parent is "current"

    if (trimmed == Zstr("/"))
        return std::nullopt; //root

    if (pos == 0)
        return Zstring(Zstr("/"));

    return trimmed.substr(0, pos);
}


bool zen::isValidRelPath(const Zstring& relPath)
{
    //relPath is expected to use FILE_NAME_SEPARATOR!
    if (contains(relPath, Zstr('\0')))
        return false;

    if (startsWith(relPath, FILE_NAME_SEPARATOR) ||
        endsWith  (relPath, FILE_NAME_SEPARATOR) ||
        contains  (relPath, Zstr("//")))
        return false;

    return true;
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(isValidRelPath(relPath));
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPath.size());
    return std::move(output) + FILE_NAME_SEPARATOR + relPath;
}


std::optional<Zstring> zen::getEnvironmentVar(const ZstringView name)
{
    const char* buffer = ::getenv(Zstring(name).c_str()); //no extended error reporting
    if (!buffer)
        return {};

    Zstring value(buffer);
    //some homebrew tools surround values with quotes: strip them
    trim(value);
    if (value.size() >= 2 && startsWith(value, Zstr('"')) && endsWith(value, Zstr('"')))
        value = value.substr(1, value.size() - 2);

    return value;
}
