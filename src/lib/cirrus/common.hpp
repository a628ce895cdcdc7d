#ifndef LIBCIRRUS_COMMON_H_
#define LIBCIRRUS_COMMON_H_

#define DELETE_COPY(cl) cl(const cl&) = delete; cl& operator=(const cl&) = delete;
#define DELETE_MOVE(cl) cl(cl&&) = delete; cl& operator=(cl&&) = delete;

#endif // LIBCIRRUS_COMMON_H_
