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
 * test-creator.cpp
 * Tests staged writes and their collision and parent policies.
 */

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <pathlab/archive.h>
#include <pathlab/creator.h>
#include <pathlab/stat.h>
#include <pathlab/stream.h>

#include "test.h"

using namespace Pathlab;

static void write_string(Stream* stream, const char* string)
{
	size_t length = strlen(string);
	test_assertx(stream->Write(string, length) == (ssize_t) length);
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

int main(void)
{
	char* path = test_temporary_path(".tar");
	// The archive is created by the first commit.
	unlink(path);
	TarAccessor* tar = TarAccessor::Mount(path);
	test_assert(tar);
	test_assertx(tar->MemberCount() == 1);

	const char* contents = "staged bytes\n";
	Creator* creator = Creator::Open(tar, "/notes.txt", TARGET_DELETE,
	                                 PARENT_RAISE, 0640);
	test_assert(creator);
	test_assertx(creator->Writable());
	write_string(creator, contents);
	StatRecord st;
	test_assertx(!tar->Stat("/notes.txt", &st) && errno == ENOENT);
	test_assertx(access(path, F_OK) < 0);
	test_assert(creator->Close());
	test_assertx(creator->IsCommitted());
	test_assertx(!creator->Writable());
	test_assertx(creator->Write("x", 1) < 0 && errno == EBADF);
	test_assertx(!creator->Close() && errno == EBADF);
	delete creator;

	test_assert(tar->Stat("/notes.txt", &st));
	test_assertx(st.type == FILE_TYPE_FILE);
	test_assertx(st.size == strlen(contents));
	test_assertx(st.permissions == 0640);
	char* data = read_string(tar, "/notes.txt");
	test_assertx(!strcmp(data, contents));
	free(data);

	// Replacing an existing file with the delete policy.
	creator = Creator::Open(tar, "/notes.txt", TARGET_DELETE, PARENT_RAISE);
	test_assert(creator);
	test_assertx(!tar->Exists("/notes.txt"));
	write_string(creator, "second");
	test_assert(creator->Close());
	delete creator;
	data = read_string(tar, "/notes.txt");
	test_assertx(!strcmp(data, "second"));
	free(data);

	test_assertx(!Creator::Open(tar, "/notes.txt", TARGET_RAISE, PARENT_RAISE) &&
	             errno == EEXIST);
	test_assertx(!strcmp(tar->ErrorPath(), "/notes.txt"));
	test_assertx(!Creator::Open(tar, "/missing/file", TARGET_RAISE,
	                            PARENT_RAISE) && errno == ENOENT);
	test_assertx(!strcmp(tar->ErrorPath(), "/missing"));
	test_assertx(!Creator::Open(tar, "/notes.txt/file", TARGET_IGNORE,
	                            PARENT_RAISE) && errno == ENOTDIR);

	// Ignoring the parent defers the failure to the commit.
	creator = Creator::Open(tar, "/missing/file", TARGET_IGNORE, PARENT_IGNORE);
	test_assert(creator);
	write_string(creator, "lost");
	test_assertx(!creator->Close() && errno == ENOENT);
	delete creator;

	// The raise policy is checked again when committing.
	creator = Creator::Open(tar, "/race.txt", TARGET_RAISE, PARENT_RAISE);
	test_assert(creator);
	test_assert(tar->Touch("/race.txt"));
	test_assertx(!creator->Close() && errno == EEXIST);
	delete creator;

	creator = Creator::Open(tar, "/a/b/c.txt", TARGET_RAISE, PARENT_CREATE);
	test_assert(creator);
	test_assertx(tar->IsDir("/a/b"));
	write_string(creator, "deep");
	test_assert(creator->Close());
	delete creator;
	data = read_string(tar, "/a/b/c.txt");
	test_assertx(!strcmp(data, "deep"));
	free(data);

	// An empty commit still creates the file.
	creator = Creator::Open(tar, "/empty", TARGET_RAISE, PARENT_RAISE);
	test_assert(creator);
	test_assert(creator->Close());
	delete creator;
	test_assert(tar->Stat("/empty", &st));
	test_assertx(st.size == 0);

	// Writing through open() stages the same way.
	Stream* stream = tar->Open("/a/opened.txt", OPEN_WRITE);
	test_assert(stream);
	test_assertx(stream->Writable());
	write_string(stream, "via open");
	test_assert(stream->Close());
	delete stream;
	data = read_string(tar, "/a/opened.txt");
	test_assertx(!strcmp(data, "via open"));
	free(data);
	delete tar;

	// Everything was committed to the file.
	tar = TarAccessor::Mount(path);
	test_assert(tar);
	data = read_string(tar, "/notes.txt");
	test_assertx(!strcmp(data, "second"));
	free(data);
	test_assertx(tar->IsFile("/race.txt"));
	test_assertx(tar->IsFile("/a/b/c.txt"));
	delete tar;

	unlink(path);
	free(path);
	return 0;
}
