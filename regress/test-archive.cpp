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
 * test-archive.cpp
 * Tests the ZIP and TAR accessors.
 */

#include <sys/stat.h>

#include <archive.h>
#include <archive_entry.h>
#include <errno.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <pathlab/accessor.h>
#include <pathlab/archive.h>
#include <pathlab/stat.h>
#include <pathlab/stream.h>

#include "test.h"

using namespace Pathlab;

struct member
{
	const char* name;
	mode_t type;
	mode_t permissions;
	const char* data;
	const char* link; // Symbolic link target, or hard link target for 0 type.
};

static void write_archive(const char* path, bool zip,
                          const struct member* members)
{
	struct archive* writer = archive_write_new();
	test_assert(writer);
	if ( zip )
		test_assertx(archive_write_set_format_zip(writer) == ARCHIVE_OK);
	else
		test_assertx(archive_write_set_format_pax_restricted(writer) ==
		             ARCHIVE_OK);
	if ( archive_write_open_filename(writer, path) != ARCHIVE_OK )
		test_error(archive_errno(writer), "%s: %s", path,
		           archive_error_string(writer));
	for ( size_t i = 0; members[i].name; i++ )
	{
		const struct member* m = &members[i];
		struct archive_entry* entry = archive_entry_new();
		test_assert(entry);
		archive_entry_set_pathname(entry, m->name);
		archive_entry_set_filetype(entry, m->type ? m->type : AE_IFREG);
		archive_entry_set_perm(entry, m->permissions);
		archive_entry_set_mtime(entry, 1700000000, 0);
		archive_entry_set_uid(entry, 1000);
		archive_entry_set_gid(entry, 100);
		size_t size = m->data ? strlen(m->data) : 0;
		archive_entry_set_size(entry, size);
		if ( m->type == AE_IFLNK )
			archive_entry_set_symlink(entry, m->link);
		else if ( !m->type )
			archive_entry_set_hardlink(entry, m->link);
		if ( archive_write_header(writer, entry) != ARCHIVE_OK )
			test_error(archive_errno(writer), "%s: %s", m->name,
			           archive_error_string(writer));
		if ( size )
			test_assertx(archive_write_data(writer, m->data, size) ==
			             (la_ssize_t) size);
		archive_entry_free(entry);
	}
	test_assertx(archive_write_close(writer) == ARCHIVE_OK);
	archive_write_free(writer);
}

static bool has_name(char** names, size_t count, const char* name)
{
	for ( size_t i = 0; i < count; i++ )
		if ( !strcmp(names[i], name) )
			return true;
	return false;
}

static void test_listing(Accessor* accessor, const char* path, size_t expected,
                         const char* name)
{
	size_t count;
	char** names = accessor->ListDir(path, &count);
	test_assert(names);
	test_assertx(count == expected);
	if ( name )
		test_assertx(has_name(names, count, name));
	FreeNames(names, count);
}

static char* read_string(Accessor* accessor, const char* path)
{
	Stream* stream = accessor->Open(path, OPEN_READ);
	test_assert(stream);
	uint8_t* data;
	ssize_t size = stream->ReadAll(&data);
	test_assert(0 <= size);
	delete stream;
	char* string = (char*) realloc(data, size + 1);
	test_assert(string);
	string[size] = '\0';
	return string;
}

static void test_string(Accessor* accessor, const char* path,
                        const char* expected)
{
	char* data = read_string(accessor, path);
	test_assertx(!strcmp(data, expected));
	free(data);
}

static const struct member basic_members[] =
{
	{ "a/", AE_IFDIR, 0755, NULL, NULL },
	{ "a/b.txt", AE_IFREG, 0644, "bee\n", NULL },
	{ NULL, 0, 0, NULL, NULL },
};

// Both formats project the same two members.
static void test_basic(ArchiveAccessor* accessor)
{
	test_assertx(accessor->MemberCount() == 3);
	size_t count;
	char** names = accessor->ListDir("/", &count);
	test_assert(names);
	test_assertx(count == 1);
	test_assertx(!strcmp(names[0], "a"));
	FreeNames(names, count);
	names = accessor->ListDir("/a", &count);
	test_assert(names);
	test_assertx(count == 1);
	test_assertx(!strcmp(names[0], "b.txt"));
	FreeNames(names, count);

	StatRecord st;
	test_assert(accessor->Stat("/a/b.txt", &st));
	test_assertx(st.type == FILE_TYPE_FILE);
	test_assertx(st.size == 4);
	test_assertx(st.permissions == 0644);
	test_assertx(st.modify_time.tv_sec == 1700000000);
	test_assertx(st.hard_link_count == 1);
	test_assert(accessor->Stat("/a", &st));
	test_assertx(st.type == FILE_TYPE_DIR);
	test_assert(accessor->Stat("//a/./b.txt", &st));
	test_string(accessor, "/a/b.txt", "bee\n");

	test_assertx(!accessor->Stat("/nope", &st) && errno == ENOENT);
	test_assertx(!accessor->ReadLink("/a/b.txt") && errno == EINVAL);
	test_assertx(!accessor->Open("/a", OPEN_READ) && errno == EISDIR);
	test_assertx(!accessor->Open("/a/b.txt", OPEN_READ, 4096) &&
	             errno == ENOTSUP);
	test_assertx(!accessor->ListDir("/a/b.txt", &count) && errno == ENOTDIR);
}

static void test_modifications(ArchiveAccessor* accessor)
{
	const char* path = accessor->ArchivePath();
	StatRecord st;

	test_assert(accessor->Touch("/a/empty"));
	test_assert(accessor->Stat("/a/empty", &st));
	test_assertx(st.size == 0);
	test_assertx(accessor->Touch("/a/empty"));
	test_assertx(!accessor->Touch("/a/empty", 0666, false) && errno == EEXIST);
	test_assertx(!accessor->Touch("/none/empty") && errno == ENOENT);

	test_assert(accessor->Mkdir("/x/y", 0750, true));
	test_assert(accessor->IsDir("/x"));
	test_assert(accessor->Stat("/x/y", &st));
	test_assertx(st.permissions == 0750);
	test_assertx(!accessor->Mkdir("/x/y") && errno == EEXIST);
	test_assert(accessor->Mkdir("/x/y", 0777, false, true));
	test_assertx(!accessor->Mkdir("/a/b.txt", 0777, false, true) &&
	             errno == EEXIST);

	test_assert(accessor->Symlink("b.txt", "/a/link"));
	StatRecord file;
	test_assert(accessor->Stat("/a/b.txt", &file));
	test_assert(accessor->Stat("/a/link", &st));
	test_assertx(st == file);
	test_assert(accessor->LStat("/a/link", &st));
	test_assertx(st.type == FILE_TYPE_SYMLINK);
	char* target = accessor->ReadLink("/a/link");
	test_assert(target);
	test_assertx(!strcmp(target, "b.txt"));
	free(target);
	test_assertx(!accessor->Symlink("elsewhere", "/a/link") && errno == EEXIST);

	// Read-after-write consistency within the accessor.
	test_string(accessor, "/a/link", "bee\n");

	test_assert(accessor->Chmod("/a/b.txt", 0600));
	test_assert(accessor->Stat("/a/b.txt", &st));
	test_assertx(st.permissions == 0600);
	test_assert(accessor->LChmod("/a/link", 0700));
	test_assert(accessor->LStat("/a/link", &st));
	test_assertx(st.permissions == 0700);
	test_assert(accessor->Stat("/a/b.txt", &st));
	test_assertx(st.permissions == 0600);

	test_assertx(!accessor->Rename("/a", "/x") && errno == EEXIST);
	test_assert(accessor->Rename("/a", "/c"));
	test_assertx(!accessor->Exists("/a"));
	test_listing(accessor, "/c", 3, "b.txt");
	test_string(accessor, "/c/link", "bee\n");
	test_assertx(!accessor->Rename("/c", "/c/inside") && errno == EINVAL);

	test_assert(accessor->Replace("/c/empty", "/c/b.txt"));
	test_assert(accessor->Stat("/c/b.txt", &st));
	test_assertx(st.size == 0);
	test_assertx(!accessor->Exists("/c/empty"));

	test_assertx(!accessor->Unlink("/c") && errno == EISDIR);
	test_assertx(!accessor->Rmdir("/c/b.txt") && errno == ENOTDIR);
	test_assertx(!accessor->Rmdir("/c") && errno == ENOTEMPTY);
	test_assert(accessor->Unlink("/c/link"));
	test_assert(accessor->Unlink("/c/b.txt"));
	test_assert(accessor->Rmdir("/c"));
	test_assertx(!accessor->Unlink("/c/b.txt") && errno == ENOENT);
	test_assertx(!accessor->Rmdir("/") && errno == EACCES);
	test_listing(accessor, "/", 1, "x");

	// Every change was written back to the archive file.
	struct stat host;
	test_assert(stat(path, &host) == 0);
	test_assertx(host.st_size != 0);
}

static void test_zip(void)
{
	char* path = test_temporary_path(".zip");
	write_archive(path, true, basic_members);
	ZipAccessor* zip = ZipAccessor::Mount(path);
	test_assert(zip);
	test_basic(zip);
	test_modifications(zip);
	delete zip;
	zip = ZipAccessor::Mount(path);
	test_assert(zip);
	test_assertx(zip->IsDir("/x/y"));
	test_assertx(!zip->Exists("/c"));
	delete zip;

	// Zip files are not tar files.
	test_assertx(!TarAccessor::Mount(path));
	unlink(path);
	free(path);
}

static const struct member tar_members[] =
{
	{ "p/q/r.txt", AE_IFREG, 0640, "arr", NULL },
	{ "p/sym", AE_IFLNK, 0777, NULL, "q/r.txt" },
	{ "p/hard", 0, 0640, NULL, "p/q/r.txt" },
	{ "./p/dup.txt", AE_IFREG, 0644, "first", NULL },
	{ "p/dup.txt", AE_IFREG, 0600, "second!", NULL },
	{ NULL, 0, 0, NULL, NULL },
};

static void test_tar(void)
{
	char* path = test_temporary_path(".tar");
	write_archive(path, false, basic_members);
	TarAccessor* tar = TarAccessor::Mount(path);
	test_assert(tar);
	test_basic(tar);
	test_modifications(tar);
	delete tar;

	write_archive(path, false, tar_members);
	tar = TarAccessor::Mount(path);
	test_assert(tar);
	StatRecord st;
	// Directories implied by member names.
	test_listing(tar, "/", 1, "p");
	test_assert(tar->Stat("/p/q", &st));
	test_assertx(st.type == FILE_TYPE_DIR);
	test_assertx(st.file_id == 0);
	test_listing(tar, "/p", 4, "hard");

	test_assert(tar->Stat("/p/sym", &st));
	test_assertx(st.type == FILE_TYPE_FILE);
	test_assertx(st.permissions == 0640);
	test_assertx(st.user_id == 1000 && st.group_id == 100);
	test_string(tar, "/p/sym", "arr");

	test_assert(tar->Stat("/p/hard", &st));
	test_assertx(st.type == FILE_TYPE_LINK);
	test_assertx(st.size == 3);
	test_assertx(tar->IsFile("/p/hard"));
	test_string(tar, "/p/hard", "arr");

	// The later of two members with one path wins.
	test_assert(tar->Stat("/p/dup.txt", &st));
	test_assertx(st.permissions == 0600);
	test_string(tar, "/p/dup.txt", "second!");

	// Hard links follow their target when it moves.
	test_assert(tar->Rename("/p/q", "/p/z"));
	test_assertx(tar->IsDir("/p/z"));
	test_string(tar, "/p/hard", "arr");
	test_string(tar, "/p/z/r.txt", "arr");
	test_assertx(!tar->Stat("/p/sym", &st) && errno == ENOENT);
	test_assert(tar->LStat("/p/sym", &st));
	delete tar;

	unlink(path);
	// A missing archive is an empty one until written.
	tar = TarAccessor::Mount(path);
	test_assert(tar);
	test_listing(tar, "/", 0, NULL);
	test_assertx(access(path, F_OK) < 0 && errno == ENOENT);
	test_assert(tar->Mkdir("/made"));
	test_assertx(access(path, F_OK) == 0);
	delete tar;
	tar = TarAccessor::Mount(path);
	test_assert(tar);
	test_assertx(tar->IsDir("/made"));
	delete tar;

	test_write_file(path, "this is not a tar archive, it is just some text",
	                strlen("this is not a tar archive, it is just some text"));
	test_assertx(!TarAccessor::Mount(path));

	unlink(path);
	free(path);
}

int main(void)
{
	test_zip();
	test_tar();
	return 0;
}
