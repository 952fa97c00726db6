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
 * test-accessor.cpp
 * Tests paths, resolution and the operations shared by every accessor.
 */

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/accessor.h>
#include <pathlab/creator.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>
#include <pathlab/stream.h>

#include "test.h"

using namespace Pathlab;

static const size_t MEMORY_ENTRIES_MAX = 64;

struct MemoryEntry
{
	char* path;
	StatRecord st;
	uint8_t* data;
	size_t size;
};

// A flat table of entries, enough to drive the shared operations.
class MemoryAccessor : public Accessor
{
public:
	MemoryAccessor();
	virtual ~MemoryAccessor();

public:
	virtual Stream* Open(const char* path, int mode, int buffering = -1);
	virtual char** ListDir(const char* path, size_t* count_out);
	virtual bool Create(const char* path, const StatRecord* st,
	                    Stream* content);
	virtual bool Move(const char* path, const char* dest);
	virtual bool Delete(const char* path);
	virtual bool Chmod(const char* path, uint32_t mode,
	                   bool follow_symlinks = true);

public:
	size_t creates;

protected:
	virtual bool Lookup(const char* resolved_path, StatRecord* st);

private:
	MemoryEntry* Find(const char* path);
	void Remove(MemoryEntry* entry);

private:
	MemoryEntry* entries[MEMORY_ENTRIES_MAX];
	size_t entries_used;

};

MemoryAccessor::MemoryAccessor()
{
	this->creates = 0;
	this->entries_used = 0;
	MemoryEntry* root = new MemoryEntry();
	root->path = strdup("/");
	root->st.type = FILE_TYPE_DIR;
	root->st.permissions = 0755;
	root->data = NULL;
	root->size = 0;
	entries[entries_used++] = root;
}

MemoryAccessor::~MemoryAccessor()
{
	for ( size_t i = 0; i < entries_used; i++ )
	{
		free(entries[i]->path);
		free(entries[i]->data);
		delete entries[i];
	}
}

MemoryEntry* MemoryAccessor::Find(const char* path)
{
	for ( size_t i = 0; i < entries_used; i++ )
		if ( !strcmp(entries[i]->path, path) )
			return entries[i];
	return NULL;
}

void MemoryAccessor::Remove(MemoryEntry* entry)
{
	for ( size_t i = 0; i < entries_used; i++ )
	{
		if ( entries[i] != entry )
			continue;
		entries[i] = entries[--entries_used];
		free(entry->path);
		free(entry->data);
		delete entry;
		return;
	}
}

bool MemoryAccessor::Lookup(const char* resolved_path, StatRecord* st)
{
	MemoryEntry* entry = Find(resolved_path);
	if ( !entry )
		return NotFound(resolved_path);
	return st->CopyFrom(&entry->st);
}

Stream* MemoryAccessor::Open(const char* path, int mode, int /*buffering*/)
{
	if ( mode == OPEN_WRITE )
		return Creator::Open(this, path, TARGET_IGNORE, PARENT_RAISE);
	char* resolved = Resolve(path);
	if ( !resolved )
		return NULL;
	MemoryEntry* entry = Find(resolved);
	free(resolved);
	if ( !entry )
		return NotFound(path), (Stream*) NULL;
	if ( entry->st.type == FILE_TYPE_DIR )
		return IsADirectory(path), (Stream*) NULL;
	uint8_t* copy = (uint8_t*) malloc(entry->size + 1);
	if ( !copy )
		return NULL;
	if ( entry->size )
		memcpy(copy, entry->data, entry->size);
	BufferStream* stream = new BufferStream(false);
	stream->Adopt(copy, entry->size);
	return stream;
}

char** MemoryAccessor::ListDir(const char* path, size_t* count_out)
{
	char* resolved = Resolve(path);
	if ( !resolved )
		return NULL;
	MemoryEntry* dir = Find(resolved);
	if ( !dir || dir->st.type != FILE_TYPE_DIR )
		return free(resolved), NotADirectory(path), (char**) NULL;
	char** names = (char**) malloc(sizeof(char*) * (entries_used + 1));
	test_assert(names);
	size_t count = 0;
	for ( size_t i = 0; i < entries_used; i++ )
	{
		if ( IsRootPath(entries[i]->path) )
			continue;
		char* parent = ParentPath(entries[i]->path);
		test_assert(parent);
		if ( !strcmp(parent, resolved) )
			names[count++] = strdup(BaseName(entries[i]->path));
		free(parent);
	}
	free(resolved);
	*count_out = count;
	return names;
}

bool MemoryAccessor::Create(const char* path, const StatRecord* st,
                            Stream* content)
{
	char* parent = ParentPath(path);
	test_assert(parent);
	MemoryEntry* dir = Find(parent);
	free(parent);
	if ( !dir )
		return NotFound(path);
	if ( dir->st.type != FILE_TYPE_DIR )
		return NotADirectory(path);
	if ( MemoryEntry* existing = Find(path) )
	{
		if ( existing->st.type == FILE_TYPE_DIR )
			return AlreadyExists(path);
		Remove(existing);
	}
	test_assertx(entries_used < MEMORY_ENTRIES_MAX);
	MemoryEntry* entry = new MemoryEntry();
	entry->path = strdup(path);
	entry->data = NULL;
	entry->size = 0;
	test_assert(entry->st.CopyFrom(st));
	if ( content )
	{
		test_assertx(content->Seek(0, SEEK_SET) == 0);
		ssize_t size = content->ReadAll(&entry->data);
		test_assertx(0 <= size);
		entry->size = (size_t) size;
		entry->st.size = entry->size;
	}
	entry->st.file_id = ++creates;
	entries[entries_used++] = entry;
	return true;
}

bool MemoryAccessor::Move(const char* path, const char* dest)
{
	if ( !Find(path) )
		return NotFound(path);
	if ( MemoryEntry* existing = Find(dest) )
		Remove(existing);
	size_t path_length = strlen(path);
	for ( size_t i = 0; i < entries_used; i++ )
	{
		MemoryEntry* entry = entries[i];
		if ( strncmp(entry->path, path, path_length) != 0 ||
		     (entry->path[path_length] && entry->path[path_length] != '/') )
			continue;
		char* renamed;
		test_assertx(0 <= asprintf(&renamed, "%s%s", dest,
		                           entry->path + path_length));
		free(entry->path);
		entry->path = renamed;
	}
	return true;
}

bool MemoryAccessor::Delete(const char* path)
{
	MemoryEntry* entry = Find(path);
	if ( !entry )
		return NotFound(path);
	if ( IsRootPath(path) )
		return PermissionDenied(path);
	Remove(entry);
	return true;
}

bool MemoryAccessor::Chmod(const char* path, uint32_t mode,
                           bool follow_symlinks)
{
	char* resolved = ResolvePath(path, follow_symlinks, true);
	if ( !resolved )
		return false;
	MemoryEntry* entry = Find(resolved);
	free(resolved);
	if ( !entry )
		return NotFound(path);
	entry->st.permissions = mode & PATHLAB_S_IPERM;
	return true;
}

// Only the root directory exists and nothing can be changed.
class RootAccessor : public Accessor
{
public:
	virtual Stream* Open(const char* path, int /*mode*/, int /*buffering*/)
	{
		return IsADirectory(path), (Stream*) NULL;
	}

	virtual char** ListDir(const char* /*path*/, size_t* count_out)
	{
		*count_out = 0;
		return (char**) malloc(sizeof(char*));
	}

protected:
	virtual bool Lookup(const char* resolved_path, StatRecord* st)
	{
		if ( !IsRootPath(resolved_path) )
			return NotFound(resolved_path);
		st->Reset();
		st->type = FILE_TYPE_DIR;
		return true;
	}

};

static void test_paths()
{
	const char* cases[][2] =
	{
		{ "", "/" },
		{ "/", "/" },
		{ "//", "/" },
		{ "a//b/./c/", "/a/b/c" },
		{ "/./a/", "/a" },
		{ "/a/../b", "/a/../b" },
	};
	for ( size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); i++ )
	{
		char* normalized = NormalizePath(cases[i][0]);
		test_assert(normalized);
		test_assertx(!strcmp(normalized, cases[i][1]));
		free(normalized);
	}
	char* joined = JoinPath("/a", "b//c");
	test_assertx(!strcmp(joined, "/a/b/c"));
	free(joined);
	joined = JoinPath("/a", "/z");
	test_assertx(!strcmp(joined, "/z"));
	free(joined);
	char* parent = ParentPath("/a/b");
	test_assertx(!strcmp(parent, "/a"));
	free(parent);
	parent = ParentPath("/a");
	test_assertx(!strcmp(parent, "/"));
	free(parent);
	parent = ParentPath("/");
	test_assertx(!strcmp(parent, "/"));
	free(parent);
	test_assertx(!strcmp(BaseName("/a/b"), "b"));
	test_assertx(!strcmp(BaseName("/"), ""));
	test_assertx(IsRootPath("//"));
	test_assertx(!IsRootPath("/a"));
	test_assertx(HashPath("/a") != HashPath("/b"));
}

static void test_virtual_paths(MemoryAccessor* memory, RootAccessor* other)
{
	VirtualPath root = memory->Root();
	test_assertx(root.IsRoot());
	test_assertx(!strcmp(root.String(), "/"));
	VirtualPath file = root.Join("dirB").Join("file");
	test_assertx(!strcmp(file.String(), "/dirB/file"));
	test_assertx(!strcmp(file.Name(), "file"));
	test_assertx(file.Parent() == memory->MakePath("dirB/"));
	test_assertx(file.Parent().Parent().IsRoot());
	test_assertx(file == memory->MakePath("//dirB/./file"));
	test_assertx(file != other->MakePath("/dirB/file"));
	test_assertx(!file.SameAccessor(other->Root()));
	test_assertx(file.IsFile());
	StatRecord st;
	test_assert(file.Stat(&st));
	test_assertx(st.size == 4);

	VirtualPath copy = file;
	test_assertx(copy == file);
	copy = root;
	test_assertx(copy.IsRoot());

	VirtualPath invalid;
	test_assertx(!invalid.IsValid());
	test_assertx(!invalid.Stat(&st) && errno == EINVAL);
	test_assertx(!invalid.Exists());
	test_assertx(!file.Rename(other->MakePath("/x")) && errno == EXDEV);

	size_t count;
	VirtualPath* children = memory->MakePath("/dirB").ScanDir(&count);
	test_assert(children);
	test_assertx(count == 1);
	for ( size_t i = 0; i < count; i++ )
		test_assertx(children[i].Parent() == memory->MakePath("/dirB"));
	delete[] children;

	VirtualPath resolved = memory->MakePath("/dirA/linkC/file").Resolve();
	test_assertx(resolved == file);
}

static void test_resolution(MemoryAccessor* memory)
{
	char* resolved = memory->Resolve("/dirA/linkC/../foo/in/spam", false);
	test_assert(resolved);
	test_assertx(!strcmp(resolved, "/foo/in/spam"));
	free(resolved);
	test_assertx(!memory->Resolve("/dirA/linkC/../foo/in/spam", true) &&
	             errno == ENOENT);
	test_assertx(!strcmp(memory->ErrorPath(), "/foo"));

	resolved = memory->Resolve("/dirA/linkC");
	test_assert(resolved);
	test_assertx(!strcmp(resolved, "/dirB"));
	free(resolved);

	resolved = memory->Resolve("/dirB/file/below/..", false);
	test_assert(resolved);
	test_assertx(!strcmp(resolved, "/dirB/file"));
	free(resolved);
	test_assertx(!memory->Resolve("/dirB/file/below") && errno == ENOTDIR);

	resolved = memory->Resolve("/absolute/x", false);
	test_assert(resolved);
	test_assertx(!strcmp(resolved, "/dirB/x"));
	free(resolved);

	test_assertx(!memory->Resolve("/loop") && errno == ENOENT);
	test_assertx(!memory->Resolve("/loop", false) && errno == ENOENT);
	StatRecord st;
	test_assert(memory->LStat("/loop", &st));
	test_assertx(st.type == FILE_TYPE_SYMLINK);

	// The final component of lstat is never followed.
	test_assert(memory->LStat("/dirA/linkC", &st));
	test_assertx(st.type == FILE_TYPE_SYMLINK);
	test_assert(memory->Stat("/dirA/linkC", &st));
	test_assertx(st.type == FILE_TYPE_DIR);
	test_assert(memory->LStat("/dirA/linkC/file", &st));
	test_assertx(st.type == FILE_TYPE_FILE);

	test_assertx(!memory->Exists("/dirB/file/below"));
	test_assertx(!memory->IsDir("/dirB/file/below"));
	test_assertx(!memory->IsFile("/nowhere"));
	test_assertx(memory->IsSymlink("/dangling"));
	test_assertx(!memory->Exists("/dangling"));
	test_assertx(memory->IsDir("/dirA/linkC"));
}

static void test_derived(MemoryAccessor* memory)
{
	StatRecord st;
	test_assertx(!memory->Mkdir("/dangling") && errno == EEXIST);
	test_assertx(!memory->Mkdir("/dangling", 0777, false, true) &&
	             errno == EEXIST);
	test_assertx(!memory->Mkdir("/new/deeper") && errno == ENOENT);
	test_assert(memory->Mkdir("/new/deeper", 0700, true));
	test_assert(memory->Stat("/new/deeper", &st));
	test_assertx(st.permissions == 0700);
	test_assert(memory->Stat("/new", &st));
	test_assertx(st.permissions == 0777);
	// Creating through a symbolic link creates in the link's directory.
	test_assert(memory->Mkdir("/dirA/linkC/made"));
	test_assertx(memory->IsDir("/dirB/made"));

	test_assert(memory->Touch("/new/file", 0640));
	test_assert(memory->Stat("/new/file", &st));
	test_assertx(st.permissions == 0640);
	size_t creates = memory->creates;
	test_assert(memory->Touch("/new/file"));
	test_assertx(memory->creates == creates);

	test_assert(memory->Symlink("../dirB/file", "/new/link"));
	test_assert(memory->LStat("/new/link", &st));
	test_assertx(st.size == strlen("../dirB/file"));
	test_assertx(st.permissions == 0777);
	char* target = memory->ReadLink("/new/link");
	test_assertx(!strcmp(target, "../dirB/file"));
	free(target);
	test_assertx(!memory->ReadLink("/new/file") && errno == EINVAL);
	test_assertx(!memory->ReadLink("/new/none") && errno == ENOENT);

	test_assert(memory->Chmod("/new/link", 0600));
	test_assert(memory->Stat("/dirB/file", &st));
	test_assertx(st.permissions == 0600);
	test_assert(memory->LChmod("/new/link", 0700));
	test_assert(memory->LStat("/new/link", &st));
	test_assertx(st.permissions == 0700);

	test_assertx(!memory->Rename("/new/file", "/new/link") && errno == EEXIST);
	test_assert(memory->Rename("/new/file", "/new/moved"));
	test_assertx(!memory->Exists("/new/file"));
	test_assert(memory->Replace("/new/moved", "/new/link"));
	test_assert(memory->LStat("/new/link", &st));
	test_assertx(st.type == FILE_TYPE_FILE);
	test_assertx(!memory->Rename("/new/none", "/new/other") && errno == ENOENT);

	test_assert(memory->Symlink("/dirB/file", "/new/abs"));
	test_assert(memory->Unlink("/new/abs"));
	test_assertx(memory->IsFile("/dirB/file"));
	test_assertx(!memory->Unlink("/new") && errno == EISDIR);
	test_assertx(!memory->Rmdir("/new/link") && errno == ENOTDIR);
	test_assert(memory->Rmdir("/new/deeper"));
	test_assertx(!memory->Rmdir("/") && errno == EACCES);

	Stream* stream = memory->Open("/new/written", OPEN_WRITE);
	test_assert(stream);
	test_assertx(stream->Write("abc", 3) == 3);
	test_assert(stream->Close());
	delete stream;
	test_assert(memory->Stat("/new/written", &st));
	test_assertx(st.size == 3);
	test_assertx(st.permissions == 0666);
}

static void test_unsupported(RootAccessor* root)
{
	StatRecord st;
	test_assert(root->Stat("/", &st));
	test_assertx(!root->Touch("/file") && errno == ENOTSUP);
	test_assertx(!root->Mkdir("/dir") && errno == ENOTSUP);
	test_assertx(!root->Symlink("x", "/link") && errno == ENOTSUP);
	test_assertx(!root->Chmod("/", 0700) && errno == ENOTSUP);
	test_assertx(!root->Rmdir("/") && errno == ENOTSUP);
	test_assertx(!root->Unlink("/file") && errno == ENOENT);
	test_assertx(!root->ReadLink("/") && errno == EINVAL);
	Creator* creator = Creator::Open(root, "/file", TARGET_RAISE, PARENT_RAISE);
	test_assert(creator);
	test_assertx(!creator->Close() && errno == ENOTSUP);
	delete creator;
}

int main(void)
{
	test_paths();

	MemoryAccessor memory;
	test_assert(memory.Mkdir("/dirA"));
	test_assert(memory.Mkdir("/dirB"));
	Stream* stream = memory.Open("/dirB/file", OPEN_WRITE);
	test_assert(stream);
	test_assertx(stream->Write("data", 4) == 4);
	test_assert(stream->Close());
	delete stream;
	test_assert(memory.Symlink("../dirB", "/dirA/linkC"));
	test_assert(memory.Symlink("/dirB", "/absolute"));
	test_assert(memory.Symlink("/loop", "/loop"));
	test_assert(memory.Symlink("/nowhere", "/dangling"));

	RootAccessor root;
	test_virtual_paths(&memory, &root);
	test_resolution(&memory);
	test_derived(&memory);
	test_unsupported(&root);
	return 0;
}
