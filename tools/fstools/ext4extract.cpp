/*
 * ext4extract
 *
 * ext4extract - write the files and directories of an ext4 image to
 * a directory on the host
 *
 * This software is distributed under the Common Public License 1.0
 */
#include "e4x/libe4x.h"
#include "ext4extract.h"

#include <getopt.h>
#include <stdlib.h>
#include <string.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

static void
usage()
{
    e4x_fprintf(e4x_stderr,
        "usage: ext4extract [-vVh] [-i imgtype] [-b dev_sector_size] [-o sector_offset] [-D output_dir] [-S symlink_table] [-M metadata_table] [--save-symlinks|--text-symlinks|--empty-symlinks|--skip-symlinks] image [images]\n");
    e4x_fprintf(e4x_stderr,
        "\t-i imgtype: The format of the image file (use '-i list' for supported types)\n");
    e4x_fprintf(e4x_stderr,
        "\t-b dev_sector_size: The size (in bytes) of the device sectors\n");
    e4x_fprintf(e4x_stderr,
        "\t-o sector_offset: sector offset of the file system in the image\n");
    e4x_fprintf(e4x_stderr,
        "\t-D, --directory output_dir: directory to write the files to (default: .)\n");
    e4x_fprintf(e4x_stderr,
        "\t-S, --dump-symlink-table file: write every symbolic link and its target to file\n");
    e4x_fprintf(e4x_stderr,
        "\t-M, --dump-metadata file: write the metadata and extended attributes of every path to file\n");
    e4x_fprintf(e4x_stderr,
        "\t--save-symlinks: create symbolic links (default)\n");
    e4x_fprintf(e4x_stderr,
        "\t--text-symlinks: write the link target as the content of a regular file\n");
    e4x_fprintf(e4x_stderr,
        "\t--empty-symlinks: write an empty regular file for each link\n");
    e4x_fprintf(e4x_stderr, "\t--skip-symlinks: do not write links\n");
    e4x_fprintf(e4x_stderr, "\t-v, --verbose: verbose output to stderr\n");
    e4x_fprintf(e4x_stderr, "\t-V: Print version\n");
    e4x_fprintf(e4x_stderr, "\t-h: help. print this message\n");
}

enum {
    OPT_SAVE_SYMLINKS = 0x100,
    OPT_TEXT_SYMLINKS,
    OPT_EMPTY_SYMLINKS,
    OPT_SKIP_SYMLINKS,
};

static const struct option long_options[] = {
    {"directory", required_argument, NULL, 'D'},
    {"dump-symlink-table", required_argument, NULL, 'S'},
    {"dump-metadata", required_argument, NULL, 'M'},
    {"verbose", no_argument, NULL, 'v'},
    {"save-symlinks", no_argument, NULL, OPT_SAVE_SYMLINKS},
    {"text-symlinks", no_argument, NULL, OPT_TEXT_SYMLINKS},
    {"empty-symlinks", no_argument, NULL, OPT_EMPTY_SYMLINKS},
    {"skip-symlinks", no_argument, NULL, OPT_SKIP_SYMLINKS},
    {NULL, 0, NULL, 0}
};

struct Options {
    unsigned int ssize = 0;
    E4X_OFF_T soffset = 0;
    E4X_IMG_TYPE_ENUM imgtype = E4X_IMG_TYPE_DETECT;
    std::string out_dir = ".";
    const char *symlink_table = NULL;
    const char *metadata_table = NULL;
    E4X_SYMLINK_POLICY_ENUM policy = E4X_SYMLINK_SAVE;
    int policy_cnt = 0;
    unsigned int verbose = 0;
};

static std::variant < Options, int >
parse_args(int argc, char **argv)
{
    Options opts;
    char *cp;
    int ch;

    while ((ch = getopt_long(argc, argv, "b:D:hi:M:o:S:vV", long_options,
                NULL)) > 0) {
        switch (ch) {
        case 'b':
            opts.ssize = (unsigned int) strtoul(optarg, &cp, 0);
            if (*cp || *cp == *optarg || opts.ssize < 1) {
                e4x_fprintf(e4x_stderr,
                    "invalid argument: sector size must be positive: %s\n",
                    optarg);
                usage();
                return 1;
            }
            break;
        case 'D':
            opts.out_dir = optarg;
            break;
        case 'h':
            usage();
            return 1;
        case 'i':
            if (strcmp(optarg, "list") == 0) {
                e4x_img_type_print(e4x_stderr);
                return 1;
            }
            opts.imgtype = e4x_img_type_toid(optarg);
            if (opts.imgtype == E4X_IMG_TYPE_UNSUPP) {
                e4x_fprintf(e4x_stderr, "Unsupported image type: %s\n",
                    optarg);
                usage();
                return 1;
            }
            break;
        case 'M':
            opts.metadata_table = optarg;
            break;
        case 'o':
            if ((opts.soffset = e4x_parse_offset(optarg)) == -1) {
                e4x_error_print(e4x_stderr);
                return 1;
            }
            break;
        case 'S':
            opts.symlink_table = optarg;
            break;
        case 'v':
            opts.verbose++;
            break;
        case 'V':
            e4x_version_print(e4x_stdout);
            return 0;
        case OPT_SAVE_SYMLINKS:
            opts.policy = E4X_SYMLINK_SAVE;
            opts.policy_cnt++;
            break;
        case OPT_TEXT_SYMLINKS:
            opts.policy = E4X_SYMLINK_TEXT;
            opts.policy_cnt++;
            break;
        case OPT_EMPTY_SYMLINKS:
            opts.policy = E4X_SYMLINK_EMPTY;
            opts.policy_cnt++;
            break;
        case OPT_SKIP_SYMLINKS:
            opts.policy = E4X_SYMLINK_SKIP;
            opts.policy_cnt++;
            break;
        case '?':
        default:
            e4x_fprintf(e4x_stderr, "Unknown argument\n");
            usage();
            return 1;
        }
    }

    if (opts.policy_cnt > 1) {
        e4x_fprintf(e4x_stderr, "Only one symlink mode can be given\n");
        usage();
        return 1;
    }

    /* We need at least one more argument */
    if (optind >= argc) {
        e4x_fprintf(e4x_stderr, "Missing image name\n");
        usage();
        return 1;
    }

    return opts;
}

static int
do_it(const Options & opts, const char *const *img_paths,
    int img_paths_len)
{
    e4x_verbose = opts.verbose;

    E4xExtract extract(opts.out_dir.c_str());
    extract.setSymlinkPolicy(opts.policy);

    if (extract.openImage(img_paths_len, img_paths, opts.imgtype,
            opts.ssize)) {
        e4x_error_print(e4x_stderr);
        return 1;
    }

    if ((opts.soffset * extract.getSectorSize()) >= extract.getImageSize()) {
        e4x_fprintf(e4x_stderr,
            "Sector offset supplied is larger than disk image (maximum: %"
            PRIdOFF ")\n",
            extract.getImageSize() / extract.getSectorSize());
        return 1;
    }

    if (opts.symlink_table && extract.setSymlinkTable(opts.symlink_table)) {
        e4x_error_print(e4x_stderr);
        return 1;
    }
    if (opts.metadata_table
        && extract.setMetadataTable(opts.metadata_table)) {
        e4x_error_print(e4x_stderr);
        return 1;
    }

    uint8_t retval = extract.extractFiles(opts.soffset);

    const std::vector < E4xAuto::error_record > errors =
        extract.getErrorList();
    for (const E4xAuto::error_record & rec : errors) {
        // paths come from the image
        const std::string msg = E4xAuto::errorRecordToString(rec);
        if (e4x_print_sanitized(e4x_stderr, msg.c_str()))
            e4x_fprintf(e4x_stderr, "%s", msg.c_str());
        e4x_fprintf(e4x_stderr, "\n");
    }

    e4x_fprintf(e4x_stdout, "Files Recovered: %d\n",
        extract.getFileCount());
    e4x_fprintf(e4x_stdout, "Directories Created: %d\n",
        extract.getDirCount());
    e4x_fprintf(e4x_stdout, "Symlinks Written: %d\n",
        extract.getSymlinkCount());
    e4x_fprintf(e4x_stdout, "Skipped: %d\n", extract.getSkipCount());
    e4x_fprintf(e4x_stdout, "Errors: %" PRIuSIZE "\n", errors.size());

    return retval ? 1 : 0;
}

int
ext4extract_main(int argc, char **argv)
{
    const auto p = parse_args(argc, argv);
    if (const int *ret = std::get_if < int >(&p)) {
        return *ret;
    }

    const auto & opts = std::get < Options > (p);
    return do_it(opts, &argv[optind], argc - optind);
}
