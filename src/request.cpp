/**********************************************************************
File name: request.cpp
This file is part of: userspacefs

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about userspacefs please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#include "userspacefs/request.hpp"

#include <ostream>

namespace Userspacefs {

const char *opcode_name(Opcode op)
{
    switch (op) {
    case Opcode::LOOKUP:
        return "LOOKUP";
    case Opcode::FORGET:
        return "FORGET";
    case Opcode::BATCH_FORGET:
        return "BATCH_FORGET";
    case Opcode::GETATTR:
        return "GETATTR";
    case Opcode::SETATTR:
        return "SETATTR";
    case Opcode::READLINK:
        return "READLINK";
    case Opcode::MKNOD:
        return "MKNOD";
    case Opcode::MKDIR:
        return "MKDIR";
    case Opcode::UNLINK:
        return "UNLINK";
    case Opcode::RMDIR:
        return "RMDIR";
    case Opcode::SYMLINK:
        return "SYMLINK";
    case Opcode::RENAME:
        return "RENAME";
    case Opcode::OPEN:
        return "OPEN";
    case Opcode::CREATE:
        return "CREATE";
    case Opcode::READ:
        return "READ";
    case Opcode::WRITE:
        return "WRITE";
    case Opcode::FLUSH:
        return "FLUSH";
    case Opcode::RELEASE:
        return "RELEASE";
    case Opcode::FSYNC:
        return "FSYNC";
    case Opcode::OPENDIR:
        return "OPENDIR";
    case Opcode::READDIR:
        return "READDIR";
    case Opcode::RELEASEDIR:
        return "RELEASEDIR";
    case Opcode::FSYNCDIR:
        return "FSYNCDIR";
    case Opcode::STATFS:
        return "STATFS";
    case Opcode::OPEN_PATH:
        return "OPEN_PATH";
    }
    return "UNKNOWN";
}

std::ostream &operator<<(std::ostream &stream, Opcode op)
{
    return stream << opcode_name(op);
}

}
