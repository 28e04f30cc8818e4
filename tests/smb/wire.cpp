/**********************************************************************
File name: wire.cpp
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
#include <catch2/catch.hpp>

#include "userspacefs/smb/wire.hpp"

#include "testutils/frames.hpp"
#include "testutils/result.hpp"

using namespace Userspacefs;
using namespace Userspacefs::Smb;

TEST_CASE("Little-endian reader and writer")
{
    Writer writer;
    writer.u8(0x01);
    writer.u16(0x0302);
    writer.u32(0x07060504);
    writer.u64(0x0f0e0d0c0b0a0908);
    CHECK(writer.data() == std::string("\x01\x02\x03\x04\x05\x06\x07\x08\x09\x0a\x0b\x0c\x0d\x0e\x0f", 15));

    SECTION("values are read back in order") {
        Reader reader(writer.data());
        CHECK(*reader.u8() == 0x01);
        CHECK(*reader.u16() == 0x0302);
        CHECK(*reader.u32() == 0x07060504);
        CHECK(*reader.u64() == 0x0f0e0d0c0b0a0908);
        CHECK(reader.pos() == 15);
        check_result_error(reader.u8(), Errc::MALFORMED_REQUEST);
    }

    SECTION("short reads fail without moving") {
        Reader reader(writer.data(), 13);
        check_result_error(reader.u32(), Errc::MALFORMED_REQUEST);
        CHECK(reader.pos() == 13);
        check_result_error(reader.skip(3), Errc::MALFORMED_REQUEST);
        check_result_ok(reader.skip(2));
        check_result_error(reader.bytes(1), Errc::MALFORMED_REQUEST);
    }

    SECTION("absolute ranges are bounds-checked") {
        Reader reader(writer.data());
        auto range = reader.at(1, 2);
        require_result_ok(range);
        CHECK(*range == std::string_view("\x02\x03", 2));
        check_result_error(reader.at(14, 2), Errc::MALFORMED_REQUEST);
        check_result_error(reader.at(100, 1), Errc::MALFORMED_REQUEST);
        // empty ranges may point anywhere
        check_result_ok(reader.at(100, 0));
    }

    SECTION("padding and patching") {
        writer.align(8);
        CHECK(writer.size() == 16);
        writer.align(8);
        CHECK(writer.size() == 16);
        writer.put_u32(0, 0xdeadbeef);
        Reader reader(writer.data());
        CHECK(*reader.u32() == 0xdeadbeef);
    }
}

SCENARIO("SMB2 message headers")
{
    GIVEN("A request built by a client") {
        SmbClient client;
        client.session_id = 0x1122334455667788;
        client.tree_id = 7;
        client.next_message_id = 41;
        const std::string message = client.echo();

        WHEN("parsing the header") {
            auto header = parse_header(message);

            THEN("all fields are recovered") {
                require_result_ok(header);
                CHECK(header->command == ECHO);
                CHECK(header->message_id == 41);
                CHECK(header->session_id == 0x1122334455667788);
                CHECK(header->tree_id == 7);
                CHECK(header->process_id == 0xfeff);
                CHECK(header->credit_charge == 1);
                CHECK((header->flags & FLAG_SERVER_TO_REDIR) == 0);
            }

            AND_WHEN("writing a response header for it") {
                Writer writer;
                write_response_header(writer, *header, 0xC0000022, 5);

                THEN("the response mirrors the request") {
                    REQUIRE(writer.size() == HEADER_SIZE);
                    auto response = parse_header(writer.data());
                    require_result_ok(response);
                    CHECK(response->status == 0xC0000022);
                    CHECK(response->credits == 5);
                    CHECK(response->message_id == 41);
                    CHECK(response->tree_id == 7);
                    CHECK(response->session_id == 0x1122334455667788);
                    CHECK((response->flags & FLAG_SERVER_TO_REDIR) != 0);
                }
            }
        }

        WHEN("the message is truncated") {
            THEN("it is malformed") {
                check_result_error(parse_header(message.substr(0, HEADER_SIZE - 1)),
                                   Errc::MALFORMED_REQUEST);
            }
        }

        WHEN("the protocol id is wrong") {
            std::string broken = message;
            broken[0] = '\xff';

            THEN("it is malformed") {
                check_result_error(parse_header(broken), Errc::MALFORMED_REQUEST);
            }
        }

        WHEN("the structure size is wrong") {
            std::string broken = message;
            broken[4] = 65;

            THEN("it is malformed") {
                check_result_error(parse_header(broken), Errc::MALFORMED_REQUEST);
            }
        }
    }
}

TEST_CASE("FILETIME conversion")
{
    struct timespec epoch{};
    CHECK(to_filetime(epoch) == 116444736000000000ULL);

    struct timespec ts{};
    ts.tv_sec = 1600000000;
    ts.tv_nsec = 123456700;
    const uint64_t filetime = to_filetime(ts);
    CHECK(filetime == 132444736001234567ULL);
    auto back = from_filetime(filetime);
    CHECK(back.tv_sec == ts.tv_sec);
    CHECK(back.tv_nsec == ts.tv_nsec);

    SECTION("times before 1601 clamp to zero") {
        struct timespec ancient{};
        ancient.tv_sec = -11644473601LL;
        CHECK(to_filetime(ancient) == 0);
    }
}

TEST_CASE("UTF-16 conversion")
{
    SECTION("ASCII") {
        CHECK(utf8_to_utf16("ab") == std::string("a\0b\0", 4));
        auto text = utf16_to_utf8(std::string("a\0b\0", 4));
        require_result_ok(text);
        CHECK(*text == "ab");
    }

    SECTION("characters from the basic plane") {
        // U+00E4 and U+20AC
        CHECK(utf8_to_utf16("\xc3\xa4\xe2\x82\xac") == std::string("\xe4\x00\xac\x20", 4));
        auto text = utf16_to_utf8(std::string("\xe4\x00\xac\x20", 4));
        require_result_ok(text);
        CHECK(*text == "\xc3\xa4\xe2\x82\xac");
    }

    SECTION("characters outside the basic plane use surrogate pairs") {
        // U+1F600
        const std::string encoded("\x3d\xd8\x00\xde", 4);
        CHECK(utf8_to_utf16("\xf0\x9f\x98\x80") == encoded);
        auto text = utf16_to_utf8(encoded);
        require_result_ok(text);
        CHECK(*text == "\xf0\x9f\x98\x80");
    }

    SECTION("invalid UTF-8 becomes the replacement character") {
        CHECK(utf8_to_utf16("\xff") == std::string("\xfd\xff", 2));
        CHECK(utf8_to_utf16("\xc3") == std::string("\xfd\xff", 2));
        CHECK(utf8_to_utf16("\xc3x") == std::string("\xfd\xffx\0", 4));
    }

    SECTION("code points without a UTF-16 form become the replacement character") {
        // beyond U+10FFFF
        CHECK(utf8_to_utf16("\xf5\x80\x80\x80") == std::string("\xfd\xff", 2));
        CHECK(utf8_to_utf16("\xf4\x90\x80\x80") == std::string("\xfd\xff", 2));
        // encoded surrogate U+D800
        CHECK(utf8_to_utf16("\xed\xa0\x80") == std::string("\xfd\xff", 2));
        // overlong encoding of '/'
        CHECK(utf8_to_utf16("\xc0\xafx") == std::string("\xfd\xffx\0", 4));
        // the largest valid code point still works
        CHECK(utf8_to_utf16("\xf4\x8f\xbf\xbf") == std::string("\xff\xdb\xff\xdf", 4));
    }

    SECTION("malformed UTF-16 is rejected") {
        check_result_error(utf16_to_utf8(std::string("a", 1)), Errc::INVALID_ARGUMENT);
        // lone high surrogate
        check_result_error(utf16_to_utf8(std::string("\x3d\xd8", 2)), Errc::INVALID_ARGUMENT);
        // lone low surrogate
        check_result_error(utf16_to_utf8(std::string("\x00\xde", 2)), Errc::INVALID_ARGUMENT);
        // high surrogate followed by a regular unit
        check_result_error(utf16_to_utf8(std::string("\x3d\xd8" "a\0", 4)), Errc::INVALID_ARGUMENT);
    }
}
