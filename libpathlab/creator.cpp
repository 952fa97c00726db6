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
 * creator.cpp
 * Stages written bytes and commits them to an accessor when closed.
 */

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/accessor.h>
#include <pathlab/creator.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>

namespace Pathlab {

Creator* Creator::Open(Accessor* accessor, const char* path,
                       int target_policy, int parent_policy,
                       uint32_t permissions)
{
	char* normalized = NormalizePath(path);
	if ( !normalized )
		return NULL;
	Creator* creator = new Creator(accessor, normalized, target_policy,
	                               parent_policy, permissions);
	if ( !creator->CheckPolicies() )
	{
		int errnum = errno;
		delete creator;
		return errno = errnum, (Creator*) NULL;
	}
	return creator;
}

Creator::Creator(Accessor* accessor, char* path, int target_policy,
                 int parent_policy, uint32_t permissions) : BufferStream(true)
{
	this->accessor = accessor;
	this->path = path;
	this->target_policy = target_policy;
	this->parent_policy = parent_policy;
	this->permissions = permissions & PATHLAB_S_IPERM;
	this->committed = false;
}

Creator::~Creator()
{
	free(path);
}

bool Creator::CheckPolicies()
{
	StatRecord st;
	if ( parent_policy != PARENT_IGNORE && !IsRootPath(path) )
	{
		char* parent = ParentPath(path);
		if ( !parent )
			return false;
		bool parent_ok;
		if ( parent_policy == PARENT_CREATE )
			parent_ok = accessor->Mkdir(parent, 0777, true, true);
		else if ( !accessor->Stat(parent, &st) )
			parent_ok = IsAbsent(errno) ? accessor->NotFound(parent) : false;
		else if ( st.type != FILE_TYPE_DIR )
			parent_ok = accessor->NotADirectory(parent);
		else
			parent_ok = true;
		free(parent);
		if ( !parent_ok )
			return false;
	}
	if ( target_policy == TARGET_IGNORE )
		return true;
	if ( !accessor->LStat(path, &st) )
		return IsAbsent(errno);
	if ( target_policy == TARGET_RAISE )
		return accessor->AlreadyExists(path);
	return accessor->Unlink(path);
}

ssize_t Creator::Write(const void* buf, size_t count)
{
	if ( committed )
		return errno = EBADF, -1;
	return BufferStream::Write(buf, count);
}

bool Creator::Writable()
{
	return !committed;
}

bool Creator::Close()
{
	if ( committed )
		return errno = EBADF, false;
	if ( !CheckPolicies() )
		return false;
	StatRecord st;
	st.type = FILE_TYPE_FILE;
	st.permissions = permissions;
	st.size = used;
	st.hard_link_count = 1;
	offset = 0;
	committed = true;
	return accessor->Create(path, &st, this);
}

} // namespace Pathlab
