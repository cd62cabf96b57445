// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ZSTRING_H_2078413568204385106
#define ZSTRING_H_2078413568204385106

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "utf.h"     //


    using Zchar = char;
    #define Zstr(x) x

//native path strings: UTF-8 on Linux
using Zstring = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

const Zchar FILE_NAME_SEPARATOR = '/';

#endif //ZSTRING_H_2078413568204385106
