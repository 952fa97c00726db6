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
 * accessor.cpp
 * Operations shared by every accessor.
 */

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/accessor.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>

namespace Pathlab {

Accessor::Accessor()
{
	error_path = NULL;
}

Accessor::~Accessor()
{
	free(error_path);
}

bool Accessor::Fail(int errnum, const char* path)
{
	free(error_path);
	error_path = path ? strdup(path) : NULL;
	return errno = errnum, false;
}

bool Accessor::NotFound(const char* path)
{
	return Fail(ENOENT, path);
}

bool Accessor::AlreadyExists(const char* path)
{
	return Fail(EEXIST, path);
}

bool Accessor::NotADirectory(const char* path)
{
	return Fail(ENOTDIR, path);
}

bool Accessor::IsADirectory(const char* path)
{
	return Fail(EISDIR, path);
}

bool Accessor::NotASymlink(const char* path)
{
	return Fail(EINVAL, path);
}

bool Accessor::PermissionDenied(const char* path)
{
	return Fail(EACCES, path);
}

bool Accessor::NotSupported(const char* path)
{
	return Fail(ENOTSUP, path);
}

bool Accessor::Corrupt(const char* path)
{
	return Fail(EBADMSG, path);
}

bool Accessor::Stat(const char* path, StatRecord* st, bool follow_symlinks)
{
	char* resolved = ResolvePath(path, follow_symlinks, true);
	if ( !resolved )
		return false;
	bool result = Lookup(resolved, st);
	free(resolved);
	return result;
}

char* Accessor::ReadLink(const char* path)
{
	StatRecord st;
	if ( !LStat(path, &st) )
		return NULL;
	if ( st.type != FILE_TYPE_SYMLINK || !st.target )
		return NotASymlink(path), (char*) NULL;
	return strdup(st.target);
}

bool Accessor::Create(const char* path, const StatRecord* /*st*/,
                      Stream* /*content*/)
{
	return NotSupported(path);
}

bool Accessor::Move(const char* path, const char* /*dest*/)
{
	return NotSupported(path);
}

bool Accessor::Delete(const char* path)
{
	return NotSupported(path);
}

bool Accessor::Chmod(const char* path, uint32_t /*mode*/,
                     bool /*follow_symlinks*/)
{
	return NotSupported(path);
}

VirtualPath Accessor::Root()
{
	return VirtualPath(this, "/");
}

VirtualPath Accessor::MakePath(const char* path)
{
	return VirtualPath(this, path);
}

VirtualPath* Accessor::ScanDir(const char* path, size_t* count_out)
{
	size_t count;
	char** names = ListDir(path, &count);
	if ( !names )
		return NULL;
	VirtualPath base(this, path);
	VirtualPath* paths = new VirtualPath[count ? count : 1];
	for ( size_t i = 0; i < count; i++ )
	{
		paths[i] = base.Join(names[i]);
		if ( !paths[i].IsValid() )
		{
			delete[] paths;
			FreeNames(names, count);
			return errno = ENOMEM, (VirtualPath*) NULL;
		}
	}
	FreeNames(names, count);
	*count_out = count;
	return paths;
}

bool Accessor::LStat(const char* path, StatRecord* st)
{
	return Stat(path, st, false);
}

bool Accessor::LChmod(const char* path, uint32_t mode)
{
	return Chmod(path, mode, false);
}

// Appends the remaining components without consulting the accessor.
static char* AppendLexically(char* base, const char* rest)
{
	while ( base && *rest )
	{
		if ( *rest == '/' )
		{
			rest++;
			continue;
		}
		size_t length = strcspn(rest, "/");
		char* next;
		if ( length == 2 && !strncmp(rest, "..", 2) )
			next = ParentPath(base);
		else if ( length == 1 && rest[0] == '.' )
			next = strdup(base);
		else
		{
			char* elem = strndup(rest, length);
			next = elem ? JoinPath(base, elem) : NULL;
			free(elem);
		}
		free(base);
		base = next;
		rest += length;
	}
	return base;
}

char* Accessor::ResolvePath(const char* path, bool follow_final, bool strict)
{
	char* pending = NormalizePath(path);
	if ( !pending )
		return NULL;
	char* resolved = strdup("/");
	if ( !resolved )
		return free(pending), (char*) NULL;
	size_t followed = 0;
	size_t offset = 0;
	StatRecord st;
	while ( true )
	{
		while ( pending[offset] == '/' )
			offset++;
		if ( !pending[offset] )
			break;
		size_t elem_len = strcspn(pending + offset, "/");
		const char* rest = pending + offset + elem_len;
		bool last = !rest[strspn(rest, "/")];
		char* elem = strndup(pending + offset, elem_len);
		if ( !elem )
			return free(pending), free(resolved), (char*) NULL;
		offset += elem_len;
		if ( !strcmp(elem, ".") )
		{
			free(elem);
			continue;
		}
		char* candidate = !strcmp(elem, "..") ? ParentPath(resolved) :
		                  JoinPath(resolved, elem);
		free(elem);
		if ( !candidate )
			return free(pending), free(resolved), (char*) NULL;
		if ( IsRootPath(candidate) || (last && !follow_final) )
		{
			free(resolved);
			resolved = candidate;
			continue;
		}
		if ( !Lookup(candidate, &st) )
		{
			if ( strict || !IsAbsent(errno) )
				return free(candidate), free(pending), free(resolved),
				       (char*) NULL;
			char* result = AppendLexically(candidate, rest);
			free(pending);
			free(resolved);
			return result;
		}
		if ( st.type == FILE_TYPE_SYMLINK )
		{
			if ( SYMLINK_FOLLOW_MAX <= followed++ || !st.target )
			{
				NotFound(path);
				return free(candidate), free(pending), free(resolved),
				       (char*) NULL;
			}
			free(candidate);
			char* spliced;
			if ( asprintf(&spliced, "%s/%s", st.target, rest) < 0 )
				return free(pending), free(resolved), (char*) NULL;
			free(pending);
			pending = spliced;
			offset = 0;
			if ( st.target[0] == '/' )
			{
				char* root = strdup("/");
				if ( !root )
					return free(pending), free(resolved), (char*) NULL;
				free(resolved);
				resolved = root;
			}
			continue;
		}
		free(resolved);
		resolved = candidate;
		if ( st.type != FILE_TYPE_DIR && !last )
		{
			if ( strict )
			{
				NotADirectory(resolved);
				return free(pending), free(resolved), (char*) NULL;
			}
			char* result = AppendLexically(resolved, rest);
			free(pending);
			return result;
		}
	}
	free(pending);
	return resolved;
}

char* Accessor::ResolveParent(const char* path)
{
	return ResolvePath(path, false, true);
}

char* Accessor::Resolve(const char* path, bool strict)
{
	return ResolvePath(path, true, strict);
}

bool Accessor::Exists(const char* path)
{
	StatRecord st;
	return Stat(path, &st, true);
}

bool Accessor::IsDir(const char* path)
{
	StatRecord st;
	return Stat(path, &st, true) && st.type == FILE_TYPE_DIR;
}

bool Accessor::IsFile(const char* path)
{
	StatRecord st;
	return Stat(path, &st, true) &&
	       (st.type == FILE_TYPE_FILE || st.type == FILE_TYPE_LINK);
}

bool Accessor::IsSymlink(const char* path)
{
	StatRecord st;
	return LStat(path, &st) && st.type == FILE_TYPE_SYMLINK;
}

bool Accessor::Touch(const char* path, uint32_t mode, bool exist_ok)
{
	StatRecord st;
	if ( LStat(path, &st) )
		return exist_ok ? true : AlreadyExists(path);
	if ( !IsAbsent(errno) )
		return false;
	char* target = ResolveParent(path);
	if ( !target )
		return false;
	st.Reset();
	st.type = FILE_TYPE_FILE;
	st.permissions = mode & PATHLAB_S_IPERM;
	bool result = Create(target, &st, NULL);
	free(target);
	return result;
}

bool Accessor::Mkdir(const char* path, uint32_t mode, bool parents,
                     bool exist_ok)
{
	StatRecord st;
	if ( Stat(path, &st, true) )
	{
		if ( exist_ok && st.type == FILE_TYPE_DIR )
			return true;
		return AlreadyExists(path);
	}
	if ( !IsAbsent(errno) )
		return false;
	// A dangling symbolic link still occupies the name.
	if ( LStat(path, &st) )
		return AlreadyExists(path);
	if ( parents )
	{
		char* parent = ParentPath(path);
		if ( !parent )
			return false;
		bool parent_ok = IsRootPath(parent) || Mkdir(parent, 0777, true, true);
		free(parent);
		if ( !parent_ok )
			return false;
	}
	char* target = ResolveParent(path);
	if ( !target )
		return false;
	st.Reset();
	st.type = FILE_TYPE_DIR;
	st.permissions = mode & PATHLAB_S_IPERM;
	bool result = Create(target, &st, NULL);
	free(target);
	return result;
}

bool Accessor::Symlink(const char* target, const char* path)
{
	StatRecord st;
	if ( LStat(path, &st) )
		return AlreadyExists(path);
	if ( !IsAbsent(errno) )
		return false;
	char* resolved = ResolveParent(path);
	if ( !resolved )
		return false;
	st.Reset();
	st.type = FILE_TYPE_SYMLINK;
	st.permissions = 0777;
	st.size = strlen(target);
	if ( !st.SetTarget(target) )
		return free(resolved), false;
	bool result = Create(resolved, &st, NULL);
	free(resolved);
	return result;
}

bool Accessor::Unlink(const char* path)
{
	StatRecord st;
	if ( !LStat(path, &st) )
		return false;
	if ( st.type == FILE_TYPE_DIR )
		return IsADirectory(path);
	char* resolved = ResolveParent(path);
	if ( !resolved )
		return false;
	bool result = Delete(resolved);
	free(resolved);
	return result;
}

bool Accessor::Rmdir(const char* path)
{
	StatRecord st;
	if ( !LStat(path, &st) )
		return false;
	if ( st.type != FILE_TYPE_DIR )
		return NotADirectory(path);
	char* resolved = ResolveParent(path);
	if ( !resolved )
		return false;
	bool result = Delete(resolved);
	free(resolved);
	return result;
}

bool Accessor::Rename(const char* path, const char* dest)
{
	StatRecord st;
	if ( !LStat(path, &st) )
		return false;
	if ( LStat(dest, &st) )
		return AlreadyExists(dest);
	if ( !IsAbsent(errno) )
		return false;
	return Replace(path, dest);
}

bool Accessor::Replace(const char* path, const char* dest)
{
	StatRecord st;
	if ( !LStat(path, &st) )
		return false;
	char* source = ResolveParent(path);
	if ( !source )
		return false;
	char* destination = ResolveParent(dest);
	if ( !destination )
		return free(source), false;
	bool result = Move(source, destination);
	free(source);
	free(destination);
	return result;
}

} // namespace Pathlab
