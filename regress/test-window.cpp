/*
 * Copyright (c) 2026 Jonas 'Sortie' Termansen.
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 *
 * test-window.cpp
 * Tests memory window streams over a mapped file.
 */

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <pathlab/stream.h>
#include <pathlab/window.h>

#include "test.h"

using namespace Pathlab;

static const char contents[] = "0123456789abcdefghijklmnopqrstuvwxyz";

int main(void)
{
	char* path = test_temporary_path(".bin");
	test_write_file(path, contents, sizeof(contents) - 1);
	MemoryMap* map = MemoryMap::Open(path);
	test_assert(map);
	test_assertx(map->Size() == sizeof(contents) - 1);

	MemoryWindowStream* window = MemoryWindowStream::Create(map, 10, 20);
	test_assert(window);
	// The window keeps the map alive.
	map->Unref();
	test_assertx(window->Length() == 20);
	test_assertx(!window->Writable());
	test_assertx(window->Write("x", 1) < 0 && errno == EBADF);

	char buffer[32];
	test_assertx(window->Read(buffer, sizeof(buffer)) == 20);
	test_assertx(!memcmp(buffer, contents + 10, 20));
	test_assertx(window->Read(buffer, 1) == 0);

	test_assertx(window->Seek(0, SEEK_SET) == 0);
	const uint8_t* peeked;
	test_assertx(window->Peek(&peeked, 5) == 5);
	test_assertx(window->Tell() == 0);
	test_assertx(window->Read(buffer, 5) == 5);
	test_assertx(!memcmp(buffer, peeked, 5));
	test_assertx(!memcmp(buffer, "abcde", 5));

	test_assertx(window->Seek(-3, SEEK_END) == 17);
	const uint8_t* rest;
	test_assertx(window->ReadRest(&rest) == 3);
	test_assertx(!memcmp(rest, "rst", 3));
	test_assertx(window->Seek(-100, SEEK_CUR) == 0);
	test_assertx(window->Seek(100, SEEK_SET) == 20);
	test_assertx(window->Seek(0, 42) < 0 && errno == EINVAL);
	test_assertx(window->Seek(5, SEEK_SET) == 5);
	test_assertx(window->Seek((off_t) INT64_MAX, SEEK_CUR) == 20);
	test_assertx(window->Seek((off_t) INT64_MAX, SEEK_END) == 20);
	test_assertx(window->Seek((off_t) INT64_MIN, SEEK_CUR) == 0);
	test_assertx(window->Seek((off_t) INT64_MIN, SEEK_END) == 0);

	test_assertx(window->Seek(2, SEEK_SET) == 2);
	const uint8_t* view;
	test_assertx(window->ReadView(&view, 4) == 4);
	test_assertx(view == window->Buffer() + 2);
	test_assertx(window->Tell() == 6);

	MemoryWindowStream* derived = window->Derive(5, 10);
	test_assert(derived);
	test_assertx(derived->Offset() == 15);
	test_assertx(derived->Map() == window->Map());
	test_assertx(derived->Read(buffer, sizeof(buffer)) == 10);
	test_assertx(!memcmp(buffer, contents + 15, 10));

	test_assertx(!window->Derive(15, 6) && errno == EINVAL);
	test_assertx(!window->Derive(21, 0) && errno == EINVAL);
	test_assertx(!derived->Derive(0, 11) && errno == EINVAL);
	test_assertx(!MemoryWindowStream::Create(derived->Map(), 30, 7) &&
	             errno == EINVAL);

	// The derived window outlives its parent.
	delete window;
	test_assertx(derived->Seek(0, SEEK_SET) == 0);
	test_assertx(derived->Read(buffer, 3) == 3);
	test_assertx(!memcmp(buffer, "fgh", 3));
	delete derived;

	test_write_file(path, "", 0);
	MemoryMap* empty = MemoryMap::Open(path);
	test_assert(empty);
	test_assertx(empty->Size() == 0);
	MemoryWindowStream* nothing = MemoryWindowStream::Create(empty, 0, 0);
	test_assert(nothing);
	empty->Unref();
	test_assertx(nothing->Read(buffer, sizeof(buffer)) == 0);
	delete nothing;

	test_assertx(!MemoryMap::Open("/") && errno == EISDIR);

	BufferStream buffered(true);
	test_assertx(buffered.Write("abc", 3) == 3);
	test_assertx(buffered.Seek((off_t) INT64_MAX, SEEK_END) == 3);
	test_assertx(buffered.Seek(1, SEEK_SET) == 1);
	test_assertx(buffered.Seek((off_t) INT64_MAX, SEEK_CUR) == 3);
	test_assertx(buffered.Seek((off_t) INT64_MIN, SEEK_CUR) == 0);
	test_assertx(buffered.Seek(-1, SEEK_END) == 2);

	unlink(path);
	free(path);
	return 0;
}
