/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_img.h
 * Image layer: opens raw or EWF containers and serves byte reads from
 * them through a shared chunk cache.  Reached through libe4x.h.
 */

/**
 * \defgroup imglib C Disk Image Functions
 * \defgroup imglib_cpp C++ Disk Image Classes
 */

#ifndef _E4X_IMG_H
#define _E4X_IMG_H

#ifdef __cplusplus
extern "C" {
#endif

    /** Container formats.  DETECT tries EWF (when built in) and then raw. */
    typedef enum {
        E4X_IMG_TYPE_DETECT = 0x0000,
        E4X_IMG_TYPE_RAW = 0x0001,      ///< dd file, split dd set or block device
        E4X_IMG_TYPE_EWF = 0x0040,      ///< E01 evidence file set, via libewf
        E4X_IMG_TYPE_UNSUPP = 0xffff
    } E4X_IMG_TYPE_ENUM;

/* chunk cache geometry: number of chunks and bytes per chunk */
#define E4X_IMG_INFO_CACHE_NUM  32
#define E4X_IMG_INFO_CACHE_LEN  65536

#define E4X_IMG_INFO_TAG 0x39204231

    /**
     * Public part of an open image.  The format reader owns the rest of
     * the allocation (see IMG_INFO in e4x_img_i.h).
     */
    typedef struct E4X_IMG_INFO {
        uint32_t tag;                   ///< E4X_IMG_INFO_TAG while the handle is live
        E4X_IMG_TYPE_ENUM itype;
        E4X_OFF_T size;                 ///< Bytes of media, all segments together
        unsigned int sector_size;
        int num_img;                    ///< Number of segment files in images
        char **images;
    } E4X_IMG_INFO;

    extern E4X_IMG_INFO *e4x_img_open(int a_num_img,
        const char *const a_images[], E4X_IMG_TYPE_ENUM a_type,
        unsigned int a_ssize);
    extern E4X_IMG_INFO *e4x_img_open_sing(const char *a_image,
        E4X_IMG_TYPE_ENUM a_type, unsigned int a_ssize);
    extern void e4x_img_close(E4X_IMG_INFO *);

    extern ssize_t e4x_img_read(E4X_IMG_INFO * a_img, E4X_OFF_T a_off,
        char *a_buf, size_t a_len);

    extern E4X_IMG_TYPE_ENUM e4x_img_type_toid(const char *);
    extern const char *e4x_img_type_toname(E4X_IMG_TYPE_ENUM);
    extern void e4x_img_type_print(FILE *);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus
/**
 * \ingroup imglib_cpp
 * Owns one open image and closes it on destruction.
 */
class E4xImgInfo {
  public:
    E4xImgInfo() : m_imgInfo(NULL) {}
    ~E4xImgInfo() {
        e4x_img_close(m_imgInfo);
    }

    E4xImgInfo(const E4xImgInfo &) = delete;
    E4xImgInfo & operator=(const E4xImgInfo &) = delete;

    /**
     * Open a new image, closing any previous one first.  Arguments
     * are those of e4x_img_open().
     * @returns 1 on error (the error record is set) and 0 on success
     */
    uint8_t open(int a_num_img, const char *const a_images[],
        E4X_IMG_TYPE_ENUM a_type, unsigned int a_ssize) {
        e4x_img_close(m_imgInfo);
        m_imgInfo = e4x_img_open(a_num_img, a_images, a_type, a_ssize);
        return m_imgInfo == NULL;
    }

    ssize_t read(E4X_OFF_T a_off, char *a_buf, size_t a_len) {
        return e4x_img_read(m_imgInfo, a_off, a_buf, a_len);
    }

    E4X_IMG_INFO *get() const {
        return m_imgInfo;
    }

    /** @returns 0 when nothing is open */
    E4X_OFF_T getSize() const {
        return m_imgInfo ? m_imgInfo->size : 0;
    }

    /** @returns 0 when nothing is open */
    unsigned int getSectorSize() const {
        return m_imgInfo ? m_imgInfo->sector_size : 0;
    }

  private:
    E4X_IMG_INFO * m_imgInfo;
};

#endif
#endif
