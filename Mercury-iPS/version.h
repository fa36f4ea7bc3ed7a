#ifndef VERSION_H
#define VERSION_H

#define VER_FILEVERSION             1,0,2,0
#define VER_FILEVERSION_STR         "1.0.2.0\0"

#define VER_PRODUCTVERSION          1,0,2,0
#define VER_PRODUCTVERSION_STR      "1.02\0"

#define VER_FILEDESCRIPTION_STR     "Mercury-iPS"
#define VER_INTERNALNAME_STR        "Mercury-iPS"
#define VER_ORIGINALFILENAME_STR    "Mercury-iPS"
#define VER_PRODUCTNAME_STR         "Mercury-iPS"

#define VER_ORGANIZATION_STR        "Mercury-iPS"
#define VER_APPLICATION_STR         "Mercury-iPS"
#define VER_APPLICATION_VERSION     "1.02"

#endif // VERSION_H
