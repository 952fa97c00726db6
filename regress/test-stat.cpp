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
 * test-stat.cpp
 * Tests mode packing and stat record comparison.
 */

#include <errno.h>
#include <stdint.h>
#include <string.h>

#include <pathlab/stat.h>

#include "test.h"

using namespace Pathlab;

static void test_mode_packing()
{
	const int types[] =
	{
		FILE_TYPE_FILE, FILE_TYPE_DIR, FILE_TYPE_SYMLINK, FILE_TYPE_SOCKET,
		FILE_TYPE_FIFO, FILE_TYPE_CHAR_DEVICE, FILE_TYPE_BLOCK_DEVICE,
	};
	for ( size_t i = 0; i < sizeof(types) / sizeof(types[0]); i++ )
	{
		for ( uint32_t permissions = 0; permissions <= 07777; permissions++ )
		{
			int type;
			uint32_t unpacked;
			UnpackMode(PackMode(types[i], permissions), &type, &unpacked);
			test_assertx(type == types[i]);
			test_assertx(unpacked == permissions);
		}
	}
	test_assertx(PackMode(FILE_TYPE_DIR, 0755) == 040755);
	test_assertx(PackMode(FILE_TYPE_SYMLINK, 0777) == 0120777);
	// Hard links are regular files once packed.
	test_assertx(PackMode(FILE_TYPE_LINK, 0644) == 0100644);
	int type;
	uint32_t permissions;
	UnpackMode(0150644, &type, &permissions);
	test_assertx(type == FILE_TYPE_FILE);
	test_assertx(permissions == 0644);
	UnpackMode(0644, &type, NULL);
	test_assertx(type == FILE_TYPE_FILE);
	test_assertx(!strcmp(FileTypeName(FILE_TYPE_BLOCK_DEVICE), "block_device"));
	test_assertx(!strcmp(FileTypeName(FILE_TYPE_LINK), "link"));
}

static void test_comparison()
{
	StatRecord a;
	StatRecord b;
	a.type = b.type = FILE_TYPE_FILE;
	a.permissions = b.permissions = 0644;
	a.size = b.size = 10;
	a.file_id = b.file_id = 7;
	a.modify_time.tv_sec = b.modify_time.tv_sec = 1000;
	test_assertx(a == b);
	test_assertx(!(a < b));
	// Names and creation times are not part of the comparison.
	a.SetUser("root");
	a.create_time.tv_sec = 5;
	test_assertx(a == b);
	b.size = 11;
	test_assertx(a != b);
	test_assertx(a < b);
	b.size = 10;
	b.file_id = 6;
	test_assertx(b < a);
	b.file_id = 7;
	b.status_time.tv_nsec = 1;
	test_assertx(a < b);
	b.status_time.tv_nsec = 0;
	b.permissions = 0600;
	test_assertx(b < a);
}

static void test_copy()
{
	StatRecord a;
	a.type = FILE_TYPE_SYMLINK;
	a.permissions = 0777;
	test_assert(a.SetTarget("dirA/fileA"));
	a.size = strlen(a.target);
	a.SetGroup("a-group-name-longer-than-the-thirty-two-byte-limit");
	test_assertx(strlen(a.group) == STAT_NAME_MAX);
	StatRecord b;
	test_assert(b.CopyFrom(&a));
	test_assertx(b == a);
	test_assertx(b.target && b.target != a.target);
	test_assertx(!strcmp(b.target, "dirA/fileA"));
	test_assertx(!strcmp(b.group, a.group));
	b.Reset();
	test_assertx(!b.target);
	test_assertx(b.Mode() == 0100000);
}

int main(void)
{
	test_mode_packing();
	test_comparison();
	test_copy();
	return 0;
}
