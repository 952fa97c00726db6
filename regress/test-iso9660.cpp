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
 * test-iso9660.cpp
 * Tests the ISO 9660 accessor against generated images.
 */

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <pathlab/isoaccessor.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>
#include <pathlab/stream.h>

#include "isoimage.h"
#include "test.h"

using namespace Pathlab;

static bool has_name(char** names, size_t count, const char* name)
{
	for ( size_t i = 0; i < count; i++ )
		if ( !strcmp(names[i], name) )
			return true;
	return false;
}

static void test_listing(Iso9660Accessor* iso)
{
	size_t count;
	char** names = iso->ListDir("/", &count);
	test_assert(names);
	test_assertx(count == 6);
	test_assertx(has_name(names, count, "dirA"));
	test_assertx(has_name(names, count, "wide"));
	test_assertx(has_name(names, count, "linkA"));
	test_assertx(has_name(names, count, FIXTURE_LONG_NAME));
	test_assertx(has_name(names, count, "deep"));
	test_assertx(has_name(names, count, "PLAIN.TXT"));
	test_assertx(!has_name(names, count, "hidden"));
	FreeNames(names, count);

	names = iso->ListDir("/dirA", &count);
	test_assert(names);
	test_assertx(count == 3);
	test_assertx(!strcmp(names[0], "fileA"));
	test_assertx(!strcmp(names[1], "loop"));
	test_assertx(!strcmp(names[2], "up"));
	FreeNames(names, count);

	// Listing through a symbolic link to a directory is not possible here,
	// but listing a file is an error.
	test_assertx(!iso->ListDir("/dirA/fileA", &count) && errno == ENOTDIR);
	test_assertx(!iso->ListDir("/missing", &count) && errno == ENOENT);
}

static void test_stat(Iso9660Accessor* iso)
{
	StatRecord file;
	test_assert(iso->Stat("/dirA/fileA", &file));
	test_assertx(file.type == FILE_TYPE_FILE);
	test_assertx(file.permissions == 0644);
	test_assertx(file.size == FIXTURE_FILEA_SIZE);
	test_assertx(file.user_id == 1000);
	test_assertx(file.group_id == 1000);
	test_assertx(file.file_id == 103);
	test_assertx(file.device_id == iso->DeviceId());
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	tm.tm_year = 125;
	tm.tm_mon = 5;
	tm.tm_mday = 15;
	tm.tm_hour = 12;
	test_assertx(file.modify_time.tv_sec == timegm(&tm));

	StatRecord followed;
	test_assert(iso->Stat("/linkA", &followed));
	test_assertx(followed == file);
	StatRecord link;
	test_assert(iso->Stat("/linkA", &link, false));
	test_assertx(link.type == FILE_TYPE_SYMLINK);
	test_assertx(link.size == strlen("dirA/fileA"));
	test_assert(iso->LStat("/dirA/up", &link));
	test_assertx(link.type == FILE_TYPE_SYMLINK);
	test_assertx(!strcmp(link.target, "../linkA"));
	test_assert(iso->Stat("/dirA/up", &followed));
	test_assertx(followed == file);

	char* target = iso->ReadLink("/linkA");
	test_assert(target);
	test_assertx(!strcmp(target, "dirA/fileA"));
	free(target);
	test_assertx(!iso->ReadLink("/dirA/fileA") && errno == EINVAL);
	test_assertx(!strcmp(iso->ErrorPath(), "/dirA/fileA"));

	StatRecord missing;
	test_assertx(!iso->Stat("/dirA/nothing", &missing) && errno == ENOENT);
	test_assertx(!iso->Stat("/dirA/fileA/below", &missing) && errno == ENOTDIR);
	test_assertx(!iso->Stat("/dirA/loop", &missing) && errno == ENOENT);
	test_assert(iso->LStat("/dirA/loop", &missing));
	test_assertx(!iso->Stat("/hidden", &missing) && errno == ENOENT);

	StatRecord plain;
	test_assert(iso->Stat("/PLAIN.TXT", &plain));
	test_assertx(plain.type == FILE_TYPE_FILE);
	test_assertx(plain.permissions == 0555);
	test_assertx(plain.size == 3);

	StatRecord root;
	test_assert(iso->Stat("/", &root));
	test_assertx(root.type == FILE_TYPE_DIR);
	test_assertx(root.file_id == 100);
	test_assertx(root.hard_link_count == 4);

	test_assertx(iso->IsDir("/dirA"));
	test_assertx(iso->IsFile("/linkA"));
	test_assertx(iso->IsSymlink("/linkA"));
	test_assertx(!iso->IsSymlink("/dirA"));
	test_assertx(!iso->Exists("/dirA/fileA/below"));
	test_assertx(!iso->Exists("/dirA/loop"));
}

static void test_continuation_and_relocation(Iso9660Accessor* iso)
{
	char* path = JoinPath("/", FIXTURE_LONG_NAME);
	test_assert(path);
	StatRecord st;
	test_assert(iso->Stat(path, &st));
	test_assertx(st.permissions == 0600);
	test_assertx(st.size == 5);
	free(path);

	test_assert(iso->Stat("/deep", &st));
	test_assertx(st.type == FILE_TYPE_DIR);
	test_assertx(st.permissions == 0700);
	size_t count;
	char** names = iso->ListDir("/deep", &count);
	test_assert(names);
	test_assertx(count == 1);
	test_assertx(!strcmp(names[0], "inner.txt"));
	FreeNames(names, count);
	test_assert(iso->Stat("/deep/inner.txt", &st));
	test_assertx(st.permissions == 0444);
}

static void test_wide_directory(Iso9660Accessor* iso)
{
	size_t count;
	char** names = iso->ListDir("/wide", &count);
	test_assert(names);
	test_assertx(count == FIXTURE_WIDE_ENTRIES + 1);
	for ( size_t i = 0; i < FIXTURE_WIDE_ENTRIES; i++ )
	{
		char name[32];
		snprintf(name, sizeof(name), "wide_entry_%02zu", i);
		test_assertx(!strcmp(names[i], name));
	}
	test_assertx(!strcmp(names[FIXTURE_WIDE_ENTRIES], "jump"));
	FreeNames(names, count);

	StatRecord last;
	test_assert(iso->Stat("/wide/wide_entry_39", &last));
	test_assertx(last.type == FILE_TYPE_FILE);

	char* target = iso->ReadLink("/wide/jump");
	test_assert(target);
	test_assertx(!strcmp(target, "/dirA/fileA"));
	free(target);
	StatRecord file;
	test_assert(iso->Stat("/dirA/fileA", &file));
	StatRecord followed;
	test_assert(iso->Stat("/wide/jump", &followed));
	test_assertx(followed == file);

	StatRecord link;
	test_assert(iso->LStat("/wide/jump", &link));
	test_assertx(link.type == FILE_TYPE_SYMLINK);
	test_assertx(link.size == strlen("/dirA/fileA"));
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	tm.tm_year = 124;
	tm.tm_mon = 2;
	tm.tm_mday = 15;
	tm.tm_hour = 8;
	tm.tm_min = 30;
	tm.tm_sec = 45;
	test_assertx(link.modify_time.tv_sec == timegm(&tm));
	test_assertx(link.modify_time.tv_nsec == 120000000);
	memset(&tm, 0, sizeof(tm));
	tm.tm_year = 123;
	tm.tm_mon = 11;
	tm.tm_mday = 31;
	tm.tm_hour = 23;
	tm.tm_min = 59;
	tm.tm_sec = 59;
	test_assertx(link.access_time.tv_sec == timegm(&tm));
	test_assertx(link.access_time.tv_nsec == 0);
}

static void test_read(Iso9660Accessor* iso)
{
	Stream* stream = iso->Open("/linkA", OPEN_READ);
	test_assert(stream);
	test_assertx(!stream->Writable());
	uint8_t* data;
	ssize_t size = stream->ReadAll(&data);
	test_assertx(size == (ssize_t) FIXTURE_FILEA_SIZE);
	test_assertx(!memcmp(data, FIXTURE_FILEA_DATA, FIXTURE_FILEA_SIZE));
	free(data);
	delete stream;

	stream = iso->Open("/deep/inner.txt", OPEN_READ);
	test_assert(stream);
	char buffer[16];
	test_assertx(stream->Read(buffer, sizeof(buffer)) == 5);
	test_assertx(!memcmp(buffer, "Hello", 5));
	delete stream;

	test_assertx(!iso->Open("/dirA", OPEN_READ) && errno == EISDIR);
	test_assertx(!iso->Open("/dirA/new", OPEN_WRITE) && errno == ENOTSUP);
	test_assertx(!iso->Open("/dirA/fileA", OPEN_READ, 4096) && errno == ENOTSUP);
	test_assertx(!iso->Mkdir("/newdir") && errno == ENOTSUP);
	test_assertx(!iso->Unlink("/dirA/fileA") && errno == ENOTSUP);
	test_assertx(!iso->Chmod("/dirA/fileA", 0600) && errno == ENOTSUP);
}

static void test_options(const char* image)
{
	IsoOptions options;
	options.cache_size = 0;
	Iso9660Accessor* uncached = Iso9660Accessor::Mount(image, &options);
	test_assert(uncached);
	Iso9660Accessor* cached = Iso9660Accessor::Mount(image);
	test_assert(cached);
	StatRecord a;
	StatRecord b;
	for ( int i = 0; i < 2; i++ )
	{
		test_assert(uncached->Stat("/dirA/up", &a));
		test_assert(cached->Stat("/dirA/up", &b));
		a.device_id = b.device_id = 0;
		test_assertx(a == b);
		test_assertx(!uncached->Stat("/dirA/none", &a) && errno == ENOENT);
		test_assertx(!cached->Stat("/dirA/none", &b) && errno == ENOENT);
	}
	test_assertx(uncached->CachedRecords() == 0);
	test_assertx(3 <= cached->CachedRecords());
	delete uncached;
	delete cached;

	options.cache_size = ISO_DEFAULT_CACHE_SIZE;
	options.no_rock = true;
	Iso9660Accessor* plain = Iso9660Accessor::Mount(image, &options);
	test_assert(plain);
	test_assertx(plain->RockRidge());
	StatRecord st;
	test_assert(plain->Stat("/DIRA/FILEA", &st));
	test_assertx(st.permissions == 0555);
	test_assertx(st.type == FILE_TYPE_FILE);
	test_assert(plain->Stat("/LINKA", &st, false));
	test_assertx(st.type == FILE_TYPE_FILE);
	test_assertx(!plain->Stat("/dirA", &st) && errno == ENOENT);
	delete plain;

	options.no_rock = false;
	options.no_susp = true;
	Iso9660Accessor* bare = Iso9660Accessor::Mount(image, &options);
	test_assert(bare);
	test_assertx(!bare->RockRidge());
	size_t count;
	char** names = bare->ListDir("/", &count);
	test_assert(names);
	test_assertx(has_name(names, count, "DIRA"));
	test_assertx(has_name(names, count, "A_FILE_N.TXT"));
	// Without SUSP the relocation marker is unknown.
	test_assertx(has_name(names, count, "HIDDEN"));
	FreeNames(names, count);
	delete bare;
}

static void test_corruption(const struct iso_fixture* fixture)
{
	struct iso_fixture copy = *fixture;
	copy.data = (uint8_t*) malloc(fixture->size);
	test_assert(copy.data);
	char* path;

	// Either copy of a dual-endian field is authoritative only if they agree.
	size_t fields[] =
	{
		fixture->filea_record + ISO9660_DIRENT_EXTENT,
		fixture->filea_record + ISO9660_DIRENT_EXTENT + 7,
		fixture->filea_record + ISO9660_DIRENT_SIZE,
		fixture->filea_record + ISO9660_DIRENT_SIZE + 4,
	};
	for ( size_t i = 0; i < sizeof(fields) / sizeof(fields[0]); i++ )
	{
		memcpy(copy.data, fixture->data, fixture->size);
		copy.data[fields[i]] ^= 0x01;
		path = iso_write_fixture(&copy);
		Iso9660Accessor* iso = Iso9660Accessor::Mount(path);
		test_assert(iso);
		StatRecord st;
		test_assertx(!iso->Stat("/dirA/fileA", &st) && errno == EBADMSG);
		test_assertx(iso->Stat("/dirA", &st));
		size_t count;
		test_assertx(!iso->ListDir("/dirA", &count) && errno == EBADMSG);
		delete iso;
		unlink(path);
		free(path);
	}

	// Mismatched root extent in the volume descriptor.
	memcpy(copy.data, fixture->data, fixture->size);
	copy.data[ISO9660_FIRST_DESCRIPTOR * ISO9660_SECTOR_SIZE +
	          ISO9660_PVD_ROOT_DIRENT + ISO9660_DIRENT_EXTENT + 4] ^= 0x80;
	path = iso_write_fixture(&copy);
	test_assertx(!Iso9660Accessor::Mount(path) && errno == EBADMSG);
	unlink(path);
	free(path);

	// Bad magic.
	memcpy(copy.data, fixture->data, fixture->size);
	copy.data[ISO9660_FIRST_DESCRIPTOR * ISO9660_SECTOR_SIZE + 1] = 'X';
	path = iso_write_fixture(&copy);
	test_assertx(!Iso9660Accessor::Mount(path) && errno == EBADMSG);
	unlink(path);
	free(path);

	// The terminator comes before any primary volume descriptor.
	memcpy(copy.data, fixture->data, fixture->size);
	copy.data[ISO9660_FIRST_DESCRIPTOR * ISO9660_SECTOR_SIZE] =
		TYPE_VOLUME_DESCRIPTOR_SET_TERMINATOR;
	path = iso_write_fixture(&copy);
	test_assertx(!Iso9660Accessor::Mount(path) && errno == EBADMSG);
	unlink(path);
	free(path);

	// A System Use entry longer than its record.
	memcpy(copy.data, fixture->data, fixture->size);
	size_t su = fixture->filea_record + 33 + strlen("FILEA.;1") + 1;
	test_assertx(copy.data[su] == 'P' && copy.data[su + 1] == 'X');
	copy.data[su + 2] = 250;
	path = iso_write_fixture(&copy);
	Iso9660Accessor* iso = Iso9660Accessor::Mount(path);
	test_assert(iso);
	StatRecord st;
	test_assertx(!iso->Stat("/dirA/fileA", &st) && errno == EBADMSG);
	delete iso;
	unlink(path);
	free(path);

	// Truncated image.
	copy.size = ISO9660_FIRST_DESCRIPTOR * ISO9660_SECTOR_SIZE + 100;
	path = iso_write_fixture(&copy);
	test_assertx(!Iso9660Accessor::Mount(path) && errno == EBADMSG);
	unlink(path);
	free(path);

	free(copy.data);
}

int main(void)
{
	struct iso_fixture fixture = iso_build_fixture();
	char* image = iso_write_fixture(&fixture);
	Iso9660Accessor* iso = Iso9660Accessor::Mount(image);
	test_assert(iso);
	test_assertx(iso->RockRidge());
	test_listing(iso);
	test_stat(iso);
	test_continuation_and_relocation(iso);
	test_wide_directory(iso);
	test_read(iso);
	delete iso;
	test_options(image);
	test_corruption(&fixture);
	test_assertx(!Iso9660Accessor::Mount("/nonexistent/image.iso") &&
	             errno == ENOENT);
	unlink(image);
	free(image);
	free(fixture.data);
	return 0;
}
