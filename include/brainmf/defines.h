#ifndef DEFINES_H
#define DEFINES_H
#define EXP exp
#define EXPM1 expm1
#define SQRT sqrt
#define SIN sin
#define COS cos

#define PI 3.14159265358979323846

// below this |d*y| the rate transfer function is evaluated by its
// series expansion around the removable singularity at y = 0
#ifndef RATE_SERIES_EPS
    #define RATE_SERIES_EPS 1e-6
#endif
#endif
