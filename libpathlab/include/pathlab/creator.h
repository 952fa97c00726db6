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
 * pathlab/creator.h
 * Stages written bytes and commits them to an accessor when closed.
 */

#ifndef INCLUDE_PATHLAB_CREATOR_H
#define INCLUDE_PATHLAB_CREATOR_H

#include <stdint.h>

#include <pathlab/stream.h>

namespace Pathlab {

class Accessor;

enum TargetPolicy
{
	TARGET_IGNORE,
	TARGET_RAISE,
	TARGET_DELETE,
};

enum ParentPolicy
{
	PARENT_IGNORE,
	PARENT_RAISE,
	PARENT_CREATE,
};

class Creator : public BufferStream
{
public:
	static Creator* Open(Accessor* accessor, const char* path,
	                     int target_policy, int parent_policy,
	                     uint32_t permissions = 0666);

private:
	Creator(Accessor* accessor, char* path, int target_policy,
	        int parent_policy, uint32_t permissions);

public:
	virtual ~Creator();

public:
	virtual ssize_t Write(const void* buf, size_t count);
	virtual bool Writable();
	virtual bool Close();

public:
	const char* Path() const { return path; }
	bool IsCommitted() const { return committed; }

private:
	bool CheckPolicies();

private:
	Accessor* accessor;
	char* path;
	int target_policy;
	int parent_policy;
	uint32_t permissions;
	bool committed;

};

} // namespace Pathlab

#endif
