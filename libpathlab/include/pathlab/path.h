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
 * pathlab/path.h
 * Normalized absolute paths bound to an accessor.
 */

#ifndef INCLUDE_PATHLAB_PATH_H
#define INCLUDE_PATHLAB_PATH_H

#include <stddef.h>
#include <stdint.h>

namespace Pathlab {

class Accessor;
class StatRecord;
class Stream;

char* NormalizePath(const char* path);
char* JoinPath(const char* a, const char* b);
char* ParentPath(const char* path);
const char* BaseName(const char* path);
bool IsRootPath(const char* path);
size_t HashPath(const char* path);
void FreeNames(char** names, size_t count);

class VirtualPath
{
public:
	VirtualPath();
	VirtualPath(Accessor* accessor, const char* path);
	VirtualPath(const VirtualPath& other);
	~VirtualPath();
	VirtualPath& operator=(const VirtualPath& other);

public:
	bool IsValid() const { return accessor && path; }
	const char* String() const { return path; }
	Accessor* GetAccessor() const { return accessor; }
	bool SameAccessor(const VirtualPath& other) const;
	bool operator==(const VirtualPath& other) const;
	bool operator!=(const VirtualPath& other) const { return !(*this == other); }
	VirtualPath Join(const char* name) const;
	VirtualPath Parent() const;
	const char* Name() const;
	bool IsRoot() const;

public:
	bool Stat(StatRecord* st, bool follow_symlinks = true) const;
	bool LStat(StatRecord* st) const;
	Stream* Open(int mode, int buffering = -1) const;
	char** ListDir(size_t* count_out) const;
	VirtualPath* ScanDir(size_t* count_out) const;
	char* ReadLink() const;
	VirtualPath Resolve(bool strict = true) const;
	bool Exists() const;
	bool IsDir() const;
	bool IsFile() const;
	bool IsSymlink() const;
	bool Touch(uint32_t mode = 0666, bool exist_ok = true) const;
	bool Mkdir(uint32_t mode = 0777, bool parents = false,
	           bool exist_ok = false) const;
	bool SymlinkTo(const char* target) const;
	bool Unlink() const;
	bool Rmdir() const;
	bool Rename(const VirtualPath& dest) const;
	bool Replace(const VirtualPath& dest) const;
	bool Chmod(uint32_t mode, bool follow_symlinks = true) const;

private:
	Accessor* accessor;
	char* path;

};

} // namespace Pathlab

#endif
