/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */
#ifndef _EXT4EXTRACT_H
#define _EXT4EXTRACT_H

extern int ext4extract_main(int argc, char **argv);

#endif
