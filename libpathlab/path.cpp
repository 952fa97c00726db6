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
 * path.cpp
 * Normalized absolute paths bound to an accessor.
 */

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/accessor.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>

namespace Pathlab {

char* NormalizePath(const char* path)
{
	size_t path_length = strlen(path);
	char* result = (char*) malloc(path_length + 2);
	if ( !result )
		return NULL;
	size_t result_length = 0;
	size_t i = 0;
	while ( true )
	{
		while ( path[i] == '/' )
			i++;
		if ( !path[i] )
			break;
		size_t segment_length = strcspn(path + i, "/");
		if ( !(segment_length == 1 && path[i] == '.') )
		{
			result[result_length++] = '/';
			memcpy(result + result_length, path + i, segment_length);
			result_length += segment_length;
		}
		i += segment_length;
	}
	if ( !result_length )
		result[result_length++] = '/';
	result[result_length] = '\0';
	return result;
}

char* JoinPath(const char* a, const char* b)
{
	if ( b[0] == '/' )
		return NormalizePath(b);
	size_t a_length = strlen(a);
	size_t b_length = strlen(b);
	char* joined = (char*) malloc(a_length + 1 + b_length + 1);
	if ( !joined )
		return NULL;
	memcpy(joined, a, a_length);
	joined[a_length] = '/';
	memcpy(joined + a_length + 1, b, b_length + 1);
	char* result = NormalizePath(joined);
	free(joined);
	return result;
}

char* ParentPath(const char* path)
{
	char* normalized = NormalizePath(path);
	if ( !normalized )
		return NULL;
	char* last = strrchr(normalized, '/');
	if ( last == normalized )
		normalized[1] = '\0';
	else
		*last = '\0';
	return normalized;
}

const char* BaseName(const char* path)
{
	const char* last = strrchr(path, '/');
	return last ? last + 1 : path;
}

bool IsRootPath(const char* path)
{
	return path[strspn(path, "/")] == '\0';
}

size_t HashPath(const char* path)
{
	size_t hash = 2166136261U;
	for ( size_t i = 0; path[i]; i++ )
	{
		hash ^= (unsigned char) path[i];
		hash *= 16777619U;
	}
	return hash;
}

void FreeNames(char** names, size_t count)
{
	if ( !names )
		return;
	for ( size_t i = 0; i < count; i++ )
		free(names[i]);
	free(names);
}

VirtualPath::VirtualPath()
{
	this->accessor = NULL;
	this->path = NULL;
}

VirtualPath::VirtualPath(Accessor* accessor, const char* path)
{
	this->accessor = accessor;
	this->path = path ? NormalizePath(path) : NULL;
}

VirtualPath::VirtualPath(const VirtualPath& other)
{
	this->accessor = other.accessor;
	this->path = other.path ? strdup(other.path) : NULL;
}

VirtualPath::~VirtualPath()
{
	free(path);
}

VirtualPath& VirtualPath::operator=(const VirtualPath& other)
{
	if ( this == &other )
		return *this;
	char* copy = other.path ? strdup(other.path) : NULL;
	free(path);
	accessor = other.accessor;
	path = copy;
	return *this;
}

bool VirtualPath::SameAccessor(const VirtualPath& other) const
{
	return accessor && accessor == other.accessor;
}

bool VirtualPath::operator==(const VirtualPath& other) const
{
	if ( !SameAccessor(other) || !path || !other.path )
		return false;
	return !strcmp(path, other.path);
}

VirtualPath VirtualPath::Join(const char* name) const
{
	VirtualPath result;
	if ( !path )
		return result;
	result.accessor = accessor;
	result.path = JoinPath(path, name);
	return result;
}

VirtualPath VirtualPath::Parent() const
{
	VirtualPath result;
	if ( !path )
		return result;
	result.accessor = accessor;
	result.path = ParentPath(path);
	return result;
}

const char* VirtualPath::Name() const
{
	return path ? BaseName(path) : NULL;
}

bool VirtualPath::IsRoot() const
{
	return path && IsRootPath(path);
}

bool VirtualPath::Stat(StatRecord* st, bool follow_symlinks) const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Stat(path, st, follow_symlinks);
}

bool VirtualPath::LStat(StatRecord* st) const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->LStat(path, st);
}

Stream* VirtualPath::Open(int mode, int buffering) const
{
	if ( !IsValid() )
		return errno = EINVAL, (Stream*) NULL;
	return accessor->Open(path, mode, buffering);
}

char** VirtualPath::ListDir(size_t* count_out) const
{
	if ( !IsValid() )
		return errno = EINVAL, (char**) NULL;
	return accessor->ListDir(path, count_out);
}

VirtualPath* VirtualPath::ScanDir(size_t* count_out) const
{
	if ( !IsValid() )
		return errno = EINVAL, (VirtualPath*) NULL;
	return accessor->ScanDir(path, count_out);
}

char* VirtualPath::ReadLink() const
{
	if ( !IsValid() )
		return errno = EINVAL, (char*) NULL;
	return accessor->ReadLink(path);
}

VirtualPath VirtualPath::Resolve(bool strict) const
{
	VirtualPath result;
	if ( !IsValid() )
		return errno = EINVAL, result;
	char* resolved = accessor->Resolve(path, strict);
	if ( !resolved )
		return result;
	result.accessor = accessor;
	result.path = resolved;
	return result;
}

bool VirtualPath::Exists() const
{
	return IsValid() && accessor->Exists(path);
}

bool VirtualPath::IsDir() const
{
	return IsValid() && accessor->IsDir(path);
}

bool VirtualPath::IsFile() const
{
	return IsValid() && accessor->IsFile(path);
}

bool VirtualPath::IsSymlink() const
{
	return IsValid() && accessor->IsSymlink(path);
}

bool VirtualPath::Touch(uint32_t mode, bool exist_ok) const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Touch(path, mode, exist_ok);
}

bool VirtualPath::Mkdir(uint32_t mode, bool parents, bool exist_ok) const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Mkdir(path, mode, parents, exist_ok);
}

bool VirtualPath::SymlinkTo(const char* target) const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Symlink(target, path);
}

bool VirtualPath::Unlink() const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Unlink(path);
}

bool VirtualPath::Rmdir() const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Rmdir(path);
}

// Moving between two accessors would need a copy, which is not done here.
bool VirtualPath::Rename(const VirtualPath& dest) const
{
	if ( !IsValid() || !dest.IsValid() )
		return errno = EINVAL, false;
	if ( !SameAccessor(dest) )
		return errno = EXDEV, false;
	return accessor->Rename(path, dest.path);
}

bool VirtualPath::Replace(const VirtualPath& dest) const
{
	if ( !IsValid() || !dest.IsValid() )
		return errno = EINVAL, false;
	if ( !SameAccessor(dest) )
		return errno = EXDEV, false;
	return accessor->Replace(path, dest.path);
}

bool VirtualPath::Chmod(uint32_t mode, bool follow_symlinks) const
{
	if ( !IsValid() )
		return errno = EINVAL, false;
	return accessor->Chmod(path, mode, follow_symlinks);
}

} // namespace Pathlab
