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
 * isoimage.h
 * Builds small ISO 9660 images with Rock Ridge entries for the tests.
 */

#ifndef ISOIMAGE_H
#define ISOIMAGE_H

#include <endian.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/iso9660.h>

#include "test.h"

using namespace Pathlab;

static const uint32_t FIXTURE_ROOT_LBA = 18;
static const uint32_t FIXTURE_DIRA_LBA = 19;
static const uint32_t FIXTURE_DATA_LBA = 20;
static const uint32_t FIXTURE_CE_LBA = 21;
static const uint32_t FIXTURE_DEEP_LBA = 22;
static const uint32_t FIXTURE_WIDE_LBA = 23;
static const uint32_t FIXTURE_WIDE_SECTORS = 2;
static const uint32_t FIXTURE_SECTORS = 25;
static const size_t FIXTURE_WIDE_ENTRIES = 40;

static const char FIXTURE_FILEA_DATA[] = "Hello, ISO!\n";
static const size_t FIXTURE_FILEA_SIZE = sizeof(FIXTURE_FILEA_DATA) - 1;
static const char FIXTURE_LONG_NAME[] =
	"a_file_name_long_enough_to_spill_into_a_continuation_area.txt";

struct iso_fixture
{
	uint8_t* data;
	size_t size;
	size_t root_record; // The "." record of the root directory.
	size_t filea_record;
};

struct su_buffer
{
	uint8_t bytes[256];
	size_t used;
};

static inline void put_both32(uint8_t* out, uint32_t value)
{
	uint32_t le = htole32(value);
	uint32_t be = htobe32(value);
	memcpy(out, &le, sizeof(le));
	memcpy(out + 4, &be, sizeof(be));
}

static inline uint8_t* su_begin(struct su_buffer* su, const char* tag,
                                size_t length)
{
	if ( sizeof(su->bytes) - su->used < length )
		test_error(0, "system use area overflow");
	uint8_t* entry = su->bytes + su->used;
	memset(entry, 0, length);
	entry[0] = tag[0];
	entry[1] = tag[1];
	entry[2] = (uint8_t) length;
	entry[3] = 1;
	su->used += length;
	return entry;
}

static inline void su_sp(struct su_buffer* su, uint8_t skip)
{
	uint8_t* entry = su_begin(su, "SP", 7);
	entry[4] = 0xBE;
	entry[5] = 0xEF;
	entry[6] = skip;
}

static inline void su_px(struct su_buffer* su, uint32_t mode, uint32_t nlink,
                         uint32_t uid, uint32_t gid, uint32_t serial)
{
	uint8_t* entry = su_begin(su, "PX", 44);
	put_both32(entry + 4, mode);
	put_both32(entry + 12, nlink);
	put_both32(entry + 20, uid);
	put_both32(entry + 28, gid);
	put_both32(entry + 36, serial);
}

static inline void su_nm(struct su_buffer* su, uint8_t flags, const char* name)
{
	size_t length = strlen(name);
	uint8_t* entry = su_begin(su, "NM", 5 + length);
	entry[4] = flags;
	memcpy(entry + 5, name, length);
}

// Components are separated by '/' in the input, ".." and "." become the
// parent and current flags.
static inline void su_sl(struct su_buffer* su, const char* target)
{
	uint8_t components[200];
	size_t used = 0;
	while ( *target )
	{
		size_t length = strcspn(target, "/");
		uint8_t flags = 0;
		if ( length == 2 && !strncmp(target, "..", 2) )
			flags = ISO9660_SL_PARENT;
		else if ( length == 1 && target[0] == '.' )
			flags = ISO9660_SL_CURRENT;
		size_t stored = flags ? 0 : length;
		components[used++] = flags;
		components[used++] = (uint8_t) stored;
		memcpy(components + used, target, stored);
		used += stored;
		target += length;
		if ( *target == '/' )
			target++;
	}
	uint8_t* entry = su_begin(su, "SL", 5 + used);
	memcpy(entry + 5, components, used);
}

// One SL entry with already encoded components. The entry flag marks a
// target continued in the next SL entry.
static inline void su_sl_raw(struct su_buffer* su, uint8_t flags,
                             const char* components, size_t length)
{
	uint8_t* entry = su_begin(su, "SL", 5 + length);
	entry[4] = flags;
	memcpy(entry + 5, components, length);
}

static inline void su_ce(struct su_buffer* su, uint32_t lba, uint32_t offset,
                         uint32_t length)
{
	uint8_t* entry = su_begin(su, "CE", 28);
	put_both32(entry + 4, lba);
	put_both32(entry + 12, offset);
	put_both32(entry + 20, length);
}

// Modification time as a short form timestamp in UTC.
static inline void su_tf(struct su_buffer* su, uint8_t year, uint8_t month,
                         uint8_t day)
{
	uint8_t* entry = su_begin(su, "TF", 5 + 7);
	entry[4] = ISO9660_TF_MODIFY;
	entry[5] = year;
	entry[6] = month;
	entry[7] = day;
	entry[8] = 12;
}

// Modification and access times as long form timestamps, each given as
// sixteen digits followed by the offset from UTC in 15 minute units.
static inline void su_tf_long(struct su_buffer* su, const char* modify,
                              int8_t modify_offset, const char* access,
                              int8_t access_offset)
{
	uint8_t* entry = su_begin(su, "TF", 5 + 2 * 17);
	entry[4] = ISO9660_TF_MODIFY | ISO9660_TF_ACCESS | ISO9660_TF_LONG_FORM;
	memcpy(entry + 5, modify, 16);
	entry[5 + 16] = (uint8_t) modify_offset;
	memcpy(entry + 5 + 17, access, 16);
	entry[5 + 17 + 16] = (uint8_t) access_offset;
}

static inline void su_cl(struct su_buffer* su, uint32_t lba)
{
	uint8_t* entry = su_begin(su, "CL", 12);
	put_both32(entry + 4, lba);
}

static inline void su_re(struct su_buffer* su)
{
	su_begin(su, "RE", 4);
}

// Appends one directory record at *offset and returns where it starts.
static inline size_t iso_record(uint8_t* image, size_t* offset,
                                uint32_t extent, uint32_t size, uint8_t flags,
                                const char* name, size_t name_length,
                                const struct su_buffer* su)
{
	size_t su_used = su ? su->used : 0;
	size_t length = 33 + name_length + !(name_length & 1) + su_used;
	length += length & 1;
	if ( 255 < length )
		test_error(0, "directory record too long");
	size_t sector_left = ISO9660_SECTOR_SIZE - *offset % ISO9660_SECTOR_SIZE;
	if ( sector_left < length )
		*offset += sector_left;
	size_t start = *offset;
	uint8_t* record = image + start;
	memset(record, 0, length);
	record[ISO9660_DIRENT_LENGTH] = (uint8_t) length;
	put_both32(record + ISO9660_DIRENT_EXTENT, extent);
	put_both32(record + ISO9660_DIRENT_SIZE, size);
	record[ISO9660_DIRENT_DATETIME + 0] = 126;
	record[ISO9660_DIRENT_DATETIME + 1] = 1;
	record[ISO9660_DIRENT_DATETIME + 2] = 2;
	record[ISO9660_DIRENT_FLAGS] = flags;
	record[ISO9660_DIRENT_NAME_LENGTH] = (uint8_t) name_length;
	memcpy(record + ISO9660_DIRENT_NAME, name, name_length);
	if ( su_used )
		memcpy(record + 33 + name_length + !(name_length & 1), su->bytes,
		       su_used);
	*offset += length;
	return start;
}

static inline size_t iso_record_named(uint8_t* image, size_t* offset,
                                      uint32_t extent, uint32_t size,
                                      uint8_t flags, const char* name,
                                      const struct su_buffer* su)
{
	return iso_record(image, offset, extent, size, flags, name, strlen(name),
	                  su);
}

static inline void iso_pvd(uint8_t* image, uint32_t sectors)
{
	struct iso9660_pvd* pvd = (struct iso9660_pvd*)
		(image + ISO9660_FIRST_DESCRIPTOR * ISO9660_SECTOR_SIZE);
	pvd->type = TYPE_PRIMARY_VOLUME_DESCRIPTOR;
	memcpy(pvd->standard_identifier, "CD001", 5);
	pvd->version = 1;
	memset(pvd->system_identifier, ' ', sizeof(pvd->system_identifier));
	memset(pvd->volume_identifier, ' ', sizeof(pvd->volume_identifier));
	memcpy(pvd->volume_identifier, "PATHLAB", 7);
	pvd->volume_space_size_le = htole32(sectors);
	pvd->volume_space_size_be = htobe32(sectors);
	pvd->volume_set_size_le = htole16(1);
	pvd->volume_set_size_be = htobe16(1);
	pvd->volume_sequence_number_le = htole16(1);
	pvd->volume_sequence_number_be = htobe16(1);
	pvd->logical_block_size_le = htole16(ISO9660_SECTOR_SIZE);
	pvd->logical_block_size_be = htobe16(ISO9660_SECTOR_SIZE);
	pvd->file_structure_version = 1;
	uint8_t* terminator = image + (ISO9660_FIRST_DESCRIPTOR + 1) *
	                              ISO9660_SECTOR_SIZE;
	terminator[0] = TYPE_VOLUME_DESCRIPTOR_SET_TERMINATOR;
	memcpy(terminator + 1, "CD001", 5);
	terminator[6] = 1;
}

// Lays out this tree:
//
//   /dirA/fileA           "Hello, ISO!\n", mode 0644, uid 1000
//   /dirA/loop         -> loop
//   /dirA/up           -> ../linkA
//   /linkA             -> dirA/fileA
//   /<FIXTURE_LONG_NAME>  name continued in a continuation area
//   /deep/inner.txt       directory relocated with CL
//   /PLAIN.TXT            no Rock Ridge entries
//   /hidden               marked RE, never listed
//   /wide/wide_entry_NN   two sectors of entries, padding before the second
//   /wide/jump         -> /dirA/fileA, split over two SL entries, long TF
static inline struct iso_fixture iso_build_fixture()
{
	struct iso_fixture fixture;
	fixture.size = FIXTURE_SECTORS * ISO9660_SECTOR_SIZE;
	fixture.data = (uint8_t*) calloc(1, fixture.size);
	if ( !fixture.data )
		test_error(errno, "calloc");
	uint8_t* image = fixture.data;
	iso_pvd(image, FIXTURE_SECTORS);

	const uint8_t dir = ISO9660_DIRENT_FLAG_DIR;
	const uint32_t sector = ISO9660_SECTOR_SIZE;
	struct su_buffer su;

	// Root directory.
	size_t offset = FIXTURE_ROOT_LBA * sector;
	su.used = 0;
	su_sp(&su, 0);
	su_px(&su, 040755, 4, 0, 0, 100);
	fixture.root_record = iso_record(image, &offset, FIXTURE_ROOT_LBA, sector,
	                                 dir, "\0", 1, &su);
	uint8_t* root_dirent = image + ISO9660_FIRST_DESCRIPTOR * sector +
	                       ISO9660_PVD_ROOT_DIRENT;
	memcpy(root_dirent, image + fixture.root_record, 34);
	root_dirent[ISO9660_DIRENT_LENGTH] = 34;
	iso_record(image, &offset, FIXTURE_ROOT_LBA, sector, dir, "\1", 1, NULL);
	su.used = 0;
	su_px(&su, 040755, 2, 0, 0, 101);
	su_nm(&su, 0, "dirA");
	iso_record_named(image, &offset, FIXTURE_DIRA_LBA, sector, dir, "DIRA", &su);
	su.used = 0;
	su_px(&su, 0120777, 1, 0, 0, 102);
	su_nm(&su, 0, "linkA");
	su_sl(&su, "dirA/fileA");
	iso_record_named(image, &offset, 0, 0, 0, "LINKA.;1", &su);
	// The name continues in the continuation area.
	size_t ce_offset = FIXTURE_CE_LBA * sector;
	struct su_buffer ce;
	ce.used = 0;
	size_t half = sizeof(FIXTURE_LONG_NAME) / 2;
	char first[sizeof(FIXTURE_LONG_NAME)];
	memcpy(first, FIXTURE_LONG_NAME, half);
	first[half] = '\0';
	su_nm(&ce, ISO9660_NM_CONTINUE, first);
	su_nm(&ce, 0, FIXTURE_LONG_NAME + half);
	su_begin(&ce, "ST", 4);
	memcpy(image + ce_offset, ce.bytes, ce.used);
	su.used = 0;
	su_px(&su, 0100600, 1, 0, 0, 104);
	su_ce(&su, FIXTURE_CE_LBA, 0, (uint32_t) ce.used);
	iso_record_named(image, &offset, FIXTURE_DATA_LBA, 5, 0, "A_FILE_N.TXT;1",
	                 &su);
	su.used = 0;
	su_px(&su, 040700, 2, 0, 0, 105);
	su_nm(&su, 0, "deep");
	su_cl(&su, FIXTURE_DEEP_LBA);
	iso_record_named(image, &offset, 0, 0, 0, "DEEP", &su);
	iso_record_named(image, &offset, FIXTURE_DATA_LBA, 3, 0, "PLAIN.TXT;1",
	                 NULL);
	su.used = 0;
	su_px(&su, 040755, 2, 0, 0, 110);
	su_nm(&su, 0, "wide");
	iso_record_named(image, &offset, FIXTURE_WIDE_LBA,
	                 FIXTURE_WIDE_SECTORS * sector, dir, "WIDE", &su);
	su.used = 0;
	su_px(&su, 040755, 2, 0, 0, 106);
	su_nm(&su, 0, "hidden");
	su_re(&su);
	iso_record_named(image, &offset, FIXTURE_DEEP_LBA, sector, dir, "HIDDEN",
	                 &su);

	// dirA.
	offset = FIXTURE_DIRA_LBA * sector;
	iso_record(image, &offset, FIXTURE_DIRA_LBA, sector, dir, "\0", 1, NULL);
	iso_record(image, &offset, FIXTURE_ROOT_LBA, sector, dir, "\1", 1, NULL);
	su.used = 0;
	su_px(&su, 0100644, 1, 1000, 1000, 103);
	su_nm(&su, 0, "fileA");
	su_tf(&su, 125, 6, 15);
	fixture.filea_record =
		iso_record_named(image, &offset, FIXTURE_DATA_LBA,
		                 (uint32_t) FIXTURE_FILEA_SIZE, 0, "FILEA.;1", &su);
	su.used = 0;
	su_px(&su, 0120777, 1, 0, 0, 107);
	su_nm(&su, 0, "loop");
	su_sl(&su, "loop");
	iso_record_named(image, &offset, 0, 0, 0, "LOOP.;1", &su);
	su.used = 0;
	su_px(&su, 0120777, 1, 0, 0, 108);
	su_nm(&su, 0, "up");
	su_sl(&su, "../linkA");
	iso_record_named(image, &offset, 0, 0, 0, "UP.;1", &su);

	// File contents.
	memcpy(image + FIXTURE_DATA_LBA * sector, FIXTURE_FILEA_DATA,
	       FIXTURE_FILEA_SIZE);

	// The relocated directory.
	offset = FIXTURE_DEEP_LBA * sector;
	su.used = 0;
	su_px(&su, 040700, 2, 0, 0, 105);
	iso_record(image, &offset, FIXTURE_DEEP_LBA, sector, dir, "\0", 1, &su);
	iso_record(image, &offset, FIXTURE_ROOT_LBA, sector, dir, "\1", 1, NULL);
	su.used = 0;
	su_px(&su, 0100444, 1, 0, 0, 109);
	su_nm(&su, 0, "inner.txt");
	iso_record_named(image, &offset, FIXTURE_DATA_LBA, 5, 0, "INNER.TXT;1",
	                 &su);

	// A directory spanning two sectors. Records never cross a sector, so the
	// first sector ends in zero padding.
	offset = FIXTURE_WIDE_LBA * sector;
	iso_record(image, &offset, FIXTURE_WIDE_LBA, FIXTURE_WIDE_SECTORS * sector,
	           dir, "\0", 1, NULL);
	iso_record(image, &offset, FIXTURE_ROOT_LBA, sector, dir, "\1", 1, NULL);
	for ( size_t i = 0; i < FIXTURE_WIDE_ENTRIES; i++ )
	{
		char iso_name[16];
		char rock_name[32];
		snprintf(iso_name, sizeof(iso_name), "W%02zu.;1", i);
		snprintf(rock_name, sizeof(rock_name), "wide_entry_%02zu", i);
		su.used = 0;
		su_nm(&su, 0, rock_name);
		iso_record_named(image, &offset, FIXTURE_DATA_LBA, 0, 0, iso_name, &su);
	}
	// The component "dirA" is split in two with the continue flag, and the
	// target continues from the first SL entry into the second.
	su.used = 0;
	su_px(&su, 0120777, 1, 0, 0, 111);
	su_nm(&su, 0, "jump");
	static const char first_components[] = "\x08\x00" "\x01\x02" "di";
	su_sl_raw(&su, ISO9660_SL_CONTINUE, first_components,
	          sizeof(first_components) - 1);
	static const char second_components[] = "\x00\x02" "rA" "\x00\x05" "fileA";
	su_sl_raw(&su, 0, second_components, sizeof(second_components) - 1);
	su_tf_long(&su, "2024031509304512", 4, "2023123123595900", 0);
	iso_record_named(image, &offset, 0, 0, 0, "JUMP.;1", &su);
	if ( offset < (FIXTURE_WIDE_LBA + 1) * sector )
		test_error(0, "wide directory fits in one sector");

	return fixture;
}

static inline char* iso_write_fixture(const struct iso_fixture* fixture)
{
	char* path = test_temporary_path(".iso");
	test_write_file(path, fixture->data, fixture->size);
	return path;
}

#endif
