// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_PATH_H_8240593716209436510
#define FILE_PATH_H_8240593716209436510

#include <optional>
#include "zstring.h"


namespace zen
{
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or empty path

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

bool isValidRelPath(const Zstring& relPath);

std::optional<Zstring> getEnvironmentVar(const ZstringView name);
}

#endif //FILE_PATH_H_8240593716209436510
