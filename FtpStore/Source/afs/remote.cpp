// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "remote.h"

using namespace zen;
using namespace fst;


RemotePath fst::sanitizeRemotePath(Zstring serverPath)
{
    //collapse "//" which isValidRelPath() rejects
    while (contains(serverPath, Zstr("//")))
        replace(serverPath, Zstr("//"), Zstr('/'));

    if (startsWith(serverPath, Zstr('/')))
        serverPath.erase(0, 1);
    if (endsWith(serverPath, Zstr('/')))
        serverPath.pop_back();

    return RemotePath(serverPath);
}


Zstring fst::getServerRelPath(const RemotePath& itemPath)
{
    return Zstr('/') + itemPath.value;
}


std::optional<RemotePath> fst::getParentPath(const RemotePath& itemPath)
{
    if (!itemPath.value.empty())
        return RemotePath(beforeLast(itemPath.value, FILE_NAME_SEPARATOR, IfNotFoundReturn::none));

    return {};
}


RemotePath fst::appendRelPath(const RemotePath& itemPath, const Zstring& relPath)
{
    return RemotePath(appendPath(itemPath.value, relPath));
}
