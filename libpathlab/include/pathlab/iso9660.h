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
 * pathlab/iso9660.h
 * Data structures for the ISO 9660 filesystem and its Rock Ridge extensions.
 */

#ifndef INCLUDE_PATHLAB_ISO9660_H
#define INCLUDE_PATHLAB_ISO9660_H

#include <stddef.h>
#include <stdint.h>

namespace Pathlab {

static const uint32_t ISO9660_SECTOR_SIZE = 2048;
static const uint32_t ISO9660_FIRST_DESCRIPTOR = 16;

static const uint8_t TYPE_PRIMARY_VOLUME_DESCRIPTOR = 0x01;
static const uint8_t TYPE_VOLUME_DESCRIPTOR_SET_TERMINATOR = 0xFF;

struct iso9660_pvd /* primary volume descriptor */
{
	uint8_t type;
	char standard_identifier[5];
	uint8_t version;
	uint8_t unused1;
	char system_identifier[32];
	char volume_identifier[32];
	uint8_t unused2[8];
	uint32_t volume_space_size_le;
	uint32_t volume_space_size_be;
	uint8_t unused3[32];
	uint16_t volume_set_size_le;
	uint16_t volume_set_size_be;
	uint16_t volume_sequence_number_le;
	uint16_t volume_sequence_number_be;
	uint16_t logical_block_size_le;
	uint16_t logical_block_size_be;
	uint32_t path_table_size_le;
	uint32_t path_table_size_be;
	uint32_t path_table_lba_le;
	uint32_t path_table_opt_lba_le;
	uint32_t path_table_lba_be;
	uint32_t path_table_opt_lba_be;
	uint8_t root_dirent[34];
	char volume_set_identifier[128];
	char publisher_identifier[128];
	char data_preparer_identifier[128];
	char application_identifier[128];
	char copyright_file_identifier[37];
	char abstract_file_identifier[37];
	char bibliographic_file_identifier[37];
	char creation_datetime[17];
	char modification_datetime[17];
	char expiration_datetime[17];
	char effective_datetime[17];
	uint8_t file_structure_version;
	uint8_t unused4;
	uint8_t application_use[512];
	uint8_t reserved[653];
};

static_assert(sizeof(struct iso9660_pvd) == 2048,
              "sizeof(struct iso9660_pvd) == 2048");

static const size_t ISO9660_PVD_ROOT_DIRENT = 156;

// Byte offsets within a directory record.
static const size_t ISO9660_DIRENT_LENGTH = 0;
static const size_t ISO9660_DIRENT_XATTR_LENGTH = 1;
static const size_t ISO9660_DIRENT_EXTENT = 2;
static const size_t ISO9660_DIRENT_SIZE = 10;
static const size_t ISO9660_DIRENT_DATETIME = 18;
static const size_t ISO9660_DIRENT_FLAGS = 25;
static const size_t ISO9660_DIRENT_NAME_LENGTH = 32;
static const size_t ISO9660_DIRENT_NAME = 33;

#define ISO9660_DIRENT_FLAG_NO_EXIST (1 << 0)
#define ISO9660_DIRENT_FLAG_DIR (1 << 1)
#define ISO9660_DIRENT_FLAG_ASSOCIATED (1 << 2)
#define ISO9660_DIRENT_FLAG_RECORD (1 << 3)
#define ISO9660_DIRENT_FLAG_PROTECTION (1 << 4)
#define ISO9660_DIRENT_FLAG_MULTI_EXTENT (1 << 7)

static const uint8_t ISO9660_NM_CONTINUE = 1 << 0;
static const uint8_t ISO9660_NM_CURRENT = 1 << 1;
static const uint8_t ISO9660_NM_PARENT = 1 << 2;

static const uint8_t ISO9660_SL_CONTINUE = 1 << 0;
static const uint8_t ISO9660_SL_CURRENT = 1 << 1;
static const uint8_t ISO9660_SL_PARENT = 1 << 2;
static const uint8_t ISO9660_SL_ROOT = 1 << 3;

static const uint8_t ISO9660_TF_CREATION = 1 << 0;
static const uint8_t ISO9660_TF_MODIFY = 1 << 1;
static const uint8_t ISO9660_TF_ACCESS = 1 << 2;
static const uint8_t ISO9660_TF_ATTRIBUTES = 1 << 3;
static const uint8_t ISO9660_TF_BACKUP = 1 << 4;
static const uint8_t ISO9660_TF_EXPIRATION = 1 << 5;
static const uint8_t ISO9660_TF_EFFECTIVE = 1 << 6;
static const uint8_t ISO9660_TF_LONG_FORM = 1 << 7;

// Continuation areas of a single record are followed at most this many times.
static const uint32_t ISO9660_CE_BLOCK_LIMIT = 32;

} // namespace Pathlab

#endif
