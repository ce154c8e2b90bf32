/*
 * ext4extract
 *
 * ext4extract - extract the files of an ext4 image.
 *      - This is main() that gets linked for the stand-alone program
 *
 * This software is distributed under the Common Public License 1.0
 */
#include "ext4extract.h"

int
main(int argc, char **argv)
{
    return ext4extract_main(argc, argv);
}
