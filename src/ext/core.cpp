#define PY_SSIZE_T_CLEAN
#define NPY_NO_DEPRECATED_API NPY_1_7_API_VERSION
#include <Python.h>
#include <numpy/arrayobject.h>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <gsl/gsl_matrix_double.h>
#include <gsl/gsl_vector_double.h>
#include "brainmf/models/base.hpp"
#include "brainmf/models/deco2018.hpp"
#include "brainmf/models/naskar2021.hpp"
#include "brainmf/bpf.hpp"
#include "brainmf/filterps.hpp"

// the model object of the current session, which is reused
// in subsequent calls to dfun; at any given time only one
// model object exists
BaseModel *model = nullptr;

std::map<std::string, std::string> dict_to_map(PyObject *config_dict, bool *ok) {
    // Create a map to hold the config values
    std::map<std::string, std::string> config_map;
    *ok = true;
    if ((config_dict == NULL) || (config_dict == Py_None)) {
        return config_map;
    }
    if (!PyDict_Check(config_dict)) {
        PyErr_SetString(PyExc_TypeError, "Config must be a dictionary.");
        *ok = false;
        return config_map;
    }
    PyObject *key, *value;
    Py_ssize_t pos = 0;
    while (PyDict_Next(config_dict, &pos, &key, &value)) {
        // Ensure key and value are strings
        if (!PyUnicode_Check(key) || !PyUnicode_Check(value)) {
            PyErr_SetString(PyExc_TypeError, "Config keys and values must be strings.");
            *ok = false;
            return config_map;
        }
        config_map[PyUnicode_AsUTF8(key)] = PyUnicode_AsUTF8(value);
    }
    return config_map;
}

// returns a new reference to a C-contiguous float64 array of
// the given number of dimensions, or NULL with the exception set
static PyArrayObject * as_double_array(PyObject *obj, int ndim, const char *arg_name) {
    PyArrayObject *arr = (PyArrayObject*)PyArray_FROM_OTF(obj, NPY_DOUBLE, NPY_ARRAY_IN_ARRAY);
    if (arr == NULL) {
        return NULL;
    }
    if (PyArray_NDIM(arr) != ndim) {
        PyErr_Format(PyExc_ValueError, "%s must be %d-dimensional", arg_name, ndim);
        Py_DECREF(arr);
        return NULL;
    }
    return arr;
}

// view on the data of a 2d array (no copy)
static gsl_matrix_const_view np_matrix_view(PyArrayObject *arr) {
    return gsl_matrix_const_view_array(
        (const double*)PyArray_DATA(arr), PyArray_DIM(arr, 0), PyArray_DIM(arr, 1));
}

static PyObject * gsl_matrix_to_np(const gsl_matrix *m) {
    npy_intp dims[2] = {(npy_intp)m->size1, (npy_intp)m->size2};
    PyObject *out = PyArray_SimpleNew(2, dims, NPY_DOUBLE);
    if (out == NULL) {
        return NULL;
    }
    gsl_matrix_view out_view = gsl_matrix_view_array(
        (double*)PyArray_DATA((PyArrayObject*)out), m->size1, m->size2);
    gsl_matrix_memcpy(&out_view.matrix, m);
    return out;
}

static PyObject * gsl_vector_to_np(const gsl_vector *v) {
    npy_intp dims[1] = {(npy_intp)v->size};
    PyObject *out = PyArray_SimpleNew(1, dims, NPY_DOUBLE);
    if (out == NULL) {
        return NULL;
    }
    double *data = (double*)PyArray_DATA((PyArrayObject*)out);
    for (size_t i = 0; i < v->size; i++) {
        data[i] = gsl_vector_get(v, i);
    }
    return out;
}

static bool set_model_params(BaseModel *m, PyObject *params_dict) {
    if ((params_dict == NULL) || (params_dict == Py_None)) {
        return true;
    }
    if (!PyDict_Check(params_dict)) {
        PyErr_SetString(PyExc_TypeError, "Parameters must be a dictionary.");
        return false;
    }
    PyObject *key, *value;
    Py_ssize_t pos = 0;
    while (PyDict_Next(params_dict, &pos, &key, &value)) {
        if (!PyUnicode_Check(key)) {
            PyErr_SetString(PyExc_TypeError, "Parameter names must be strings.");
            return false;
        }
        std::string param_name = PyUnicode_AsUTF8(key);
        bool set;
        if (PyFloat_Check(value) || PyLong_Check(value) || PyArray_IsScalar(value, Number)) {
            double scalar = PyFloat_AsDouble(value);
            if (PyErr_Occurred()) {
                return false;
            }
            set = m->set_param(param_name, ParamValue(scalar));
        } else {
            PyArrayObject *arr = as_double_array(value, 1, param_name.c_str());
            if (arr == NULL) {
                return false;
            }
            set = m->set_param(param_name, ParamValue(
                (const double*)PyArray_DATA(arr), (int)PyArray_DIM(arr, 0)));
            Py_DECREF(arr);
        }
        if (!set) {
            PyErr_Format(PyExc_ValueError, "Invalid parameter %s", param_name.c_str());
            return false;
        }
    }
    return true;
}

static PyObject* init_model(PyObject* self, PyObject* args) {
    char *model_name;
    int n_rois;
    PyObject *params_dict = Py_None, *config_dict = Py_None, *py_SC = Py_None;
    double G = 0.0;

    if (!PyArg_ParseTuple(args, "si|OOOd",
            &model_name, &n_rois, &params_dict, &config_dict, &py_SC, &G)) {
        return NULL;
    }
    if (n_rois <= 0) {
        PyErr_SetString(PyExc_ValueError, "n_rois must be positive");
        return NULL;
    }

    BaseModel *new_model;
    if (std::string(model_name) == "Deco2018") {
        new_model = new Deco2018Model(n_rois);
    } else if (std::string(model_name) == "Naskar2021") {
        new_model = new Naskar2021Model(n_rois);
    } else {
        PyErr_Format(PyExc_ValueError, "Model %s not found", model_name);
        return NULL;
    }

    bool ok;
    std::map<std::string, std::string> config_map = dict_to_map(config_dict, &ok);
    if (!ok || !set_model_params(new_model, params_dict)) {
        delete new_model;
        return NULL;
    }
    try {
        new_model->set_conf(config_map);
    } catch (const std::exception& e) {
        PyErr_Format(PyExc_ValueError, "Invalid model config: %s", e.what());
        delete new_model;
        return NULL;
    }

    if (py_SC != Py_None) {
        Deco2018Model *deco = dynamic_cast<Deco2018Model*>(new_model);
        if (deco != nullptr) {
            PyArrayObject *SC = as_double_array(py_SC, 2, "SC");
            if (SC == NULL) {
                delete new_model;
                return NULL;
            }
            gsl_matrix_const_view SC_view = np_matrix_view(SC);
            deco->set_connectivity(&SC_view.matrix, G);
            Py_DECREF(SC);
        }
    }

    if (!new_model->init_dependant()) {
        PyErr_SetString(PyExc_RuntimeError, "Model initialization failed");
        delete new_model;
        return NULL;
    }
    // replace the model of the session
    if (model != nullptr) {
        delete model;
    }
    model = new_model;
    Py_RETURN_NONE;
}

static bool check_model() {
    if (model == nullptr) {
        PyErr_SetString(PyExc_RuntimeError, "No model initialized, call init_model first");
        return false;
    }
    if (model->params_stale) {
        PyErr_SetString(PyExc_RuntimeError, "Model parameters changed after initialization");
        return false;
    }
    return true;
}

static PyObject* initial_state(PyObject* self, PyObject* args) {
    if (!check_model()) return NULL;
    gsl_matrix *state = model->initial_state();
    PyObject *out = gsl_matrix_to_np(state);
    gsl_matrix_free(state);
    return out;
}

static PyObject* initial_observed(PyObject* self, PyObject* args) {
    if (!check_model()) return NULL;
    gsl_matrix *observed = model->initial_observed();
    PyObject *out = gsl_matrix_to_np(observed);
    gsl_matrix_free(observed);
    return out;
}

static PyObject* get_param_table(PyObject* self, PyObject* args) {
    if (!check_model()) return NULL;
    return gsl_matrix_to_np(model->m);
}

static PyObject* dfun(PyObject* self, PyObject* args) {
    PyObject *py_state, *py_coupling;
    if (!PyArg_ParseTuple(args, "OO", &py_state, &py_coupling)) {
        return NULL;
    }
    if (!check_model()) return NULL;
    PyArrayObject *state = as_double_array(py_state, 2, "state");
    if (state == NULL) return NULL;
    PyArrayObject *coupling = as_double_array(py_coupling, 2, "coupling");
    if (coupling == NULL) {
        Py_DECREF(state);
        return NULL;
    }
    // shapes are validated here rather than in dfun
    if ((PyArray_DIM(state, 0) != model->get_n_state_vars()) ||
            (PyArray_DIM(state, 1) != model->n_rois) ||
            (PyArray_DIM(coupling, 0) < 1) ||
            (PyArray_DIM(coupling, 1) != model->n_rois)) {
        PyErr_Format(PyExc_ValueError,
            "state must have shape (%d, %d) and coupling (>=1, %d)",
            model->get_n_state_vars(), model->n_rois, model->n_rois);
        Py_DECREF(state);
        Py_DECREF(coupling);
        return NULL;
    }
    npy_intp dstate_dims[2] = {model->get_n_state_vars(), model->n_rois};
    npy_intp observed_dims[2] = {model->get_n_observable_vars(), model->n_rois};
    PyObject *py_dstate = PyArray_SimpleNew(2, dstate_dims, NPY_DOUBLE);
    PyObject *py_observed = PyArray_SimpleNew(2, observed_dims, NPY_DOUBLE);
    if ((py_dstate == NULL) || (py_observed == NULL)) {
        Py_XDECREF(py_dstate);
        Py_XDECREF(py_observed);
        Py_DECREF(state);
        Py_DECREF(coupling);
        return NULL;
    }
    gsl_matrix_const_view state_view = np_matrix_view(state);
    gsl_matrix_const_view coupling_view = np_matrix_view(coupling);
    gsl_matrix_view dstate_view = gsl_matrix_view_array(
        (double*)PyArray_DATA((PyArrayObject*)py_dstate), dstate_dims[0], dstate_dims[1]);
    gsl_matrix_view observed_view = gsl_matrix_view_array(
        (double*)PyArray_DATA((PyArrayObject*)py_observed), observed_dims[0], observed_dims[1]);
    model->dfun(&state_view.matrix, &coupling_view.matrix, &dstate_view.matrix, &observed_view.matrix);
    Py_DECREF(state);
    Py_DECREF(coupling);
    return Py_BuildValue("(NN)", py_dstate, py_observed);
}

static ButterworthBandPassFilter * make_filter(double TR, PyObject *filter_config) {
    bool ok;
    std::map<std::string, std::string> config_map = dict_to_map(filter_config, &ok);
    if (!ok) {
        return nullptr;
    }
    ButterworthBandPassFilter *bpf = new ButterworthBandPassFilter(TR);
    try {
        bpf->set_conf(config_map);
    } catch (const std::exception& e) {
        PyErr_Format(PyExc_ValueError, "Invalid filter config: %s", e.what());
        delete bpf;
        return nullptr;
    }
    return bpf;
}

static PyObject* filt_pow_spectra(PyObject* self, PyObject* args) {
    PyObject *py_signal, *filter_config = Py_None;
    double TR;
    if (!PyArg_ParseTuple(args, "Od|O", &py_signal, &TR, &filter_config)) {
        return NULL;
    }
    PyArrayObject *signal = as_double_array(py_signal, 2, "signal");
    if (signal == NULL) return NULL;
    ButterworthBandPassFilter *bpf = make_filter(TR, filter_config);
    if (bpf == nullptr) {
        Py_DECREF(signal);
        return NULL;
    }
    gsl_matrix_const_view signal_view = np_matrix_view(signal);
    gsl_matrix *pow_spect = filt_pow_spectra(&signal_view.matrix, TR, bpf);
    delete bpf;
    Py_DECREF(signal);
    if (pow_spect == nullptr) {
        PyErr_SetString(PyExc_RuntimeError, "Power spectrum calculation failed");
        return NULL;
    }
    PyObject *out = gsl_matrix_to_np(pow_spect);
    gsl_matrix_free(pow_spect);
    return out;
}

static PyObject* filt_pow_spectra_multiple_subjects(PyObject* self, PyObject* args) {
    PyObject *py_signal, *filter_config = Py_None;
    double TR, sigma = 0.01;
    if (!PyArg_ParseTuple(args, "Od|Od", &py_signal, &TR, &filter_config, &sigma)) {
        return NULL;
    }
    // copies of the named subjects' signals; array inputs are used in place
    std::map<std::string, gsl_matrix *> named_subjects;
    PyArrayObject *stacked = NULL;
    bool ok = true;
    if (PyDict_Check(py_signal)) {
        PyObject *key, *value;
        Py_ssize_t pos = 0;
        while (ok && PyDict_Next(py_signal, &pos, &key, &value)) {
            PyObject *key_str = PyObject_Str(key);
            PyArrayObject *arr = as_double_array(value, 2, "subject signal");
            if ((key_str == NULL) || (arr == NULL)) {
                Py_XDECREF(key_str);
                Py_XDECREF(arr);
                ok = false;
                break;
            }
            // distinct keys may have the same string form, e.g. 1 and '1'
            const char *name = PyUnicode_AsUTF8(key_str);
            if ((name == NULL) || (named_subjects.count(name) > 0)) {
                if (name != NULL) {
                    PyErr_Format(PyExc_ValueError, "Duplicate subject name %s", name);
                }
                Py_DECREF(key_str);
                Py_DECREF(arr);
                ok = false;
                break;
            }
            gsl_matrix_const_view view = np_matrix_view(arr);
            gsl_matrix *s = gsl_matrix_alloc(view.matrix.size1, view.matrix.size2);
            gsl_matrix_memcpy(s, &view.matrix);
            named_subjects[name] = s;
            Py_DECREF(key_str);
            Py_DECREF(arr);
        }
    } else {
        stacked = (PyArrayObject*)PyArray_FROM_OTF(py_signal, NPY_DOUBLE, NPY_ARRAY_IN_ARRAY);
        if (stacked == NULL) return NULL;
        if ((PyArray_NDIM(stacked) != 2) && (PyArray_NDIM(stacked) != 3)) {
            PyErr_SetString(PyExc_ValueError, "signal must be a dict, a 2d or a 3d array");
            ok = false;
        }
    }

    gsl_vector *f_peak = nullptr;
    if (ok) {
        ButterworthBandPassFilter *bpf = make_filter(TR, filter_config);
        if (bpf == nullptr) {
            ok = false;
        } else {
            if (stacked == NULL) {
                f_peak = filt_pow_spectra_multiple_subjects(named_subjects, TR, bpf, sigma);
            } else if (PyArray_NDIM(stacked) == 2) {
                gsl_matrix_const_view view = np_matrix_view(stacked);
                f_peak = filt_pow_spectra_multiple_subjects(&view.matrix, TR, bpf, sigma);
            } else {
                // (subjects, regions, time)
                f_peak = filt_pow_spectra_multiple_subjects(
                    (const double*)PyArray_DATA(stacked), (int)PyArray_DIM(stacked, 0),
                    (int)PyArray_DIM(stacked, 1), (int)PyArray_DIM(stacked, 2),
                    TR, bpf, sigma);
            }
            delete bpf;
            if (f_peak == nullptr) {
                PyErr_SetString(PyExc_RuntimeError, "Power spectrum calculation failed");
                ok = false;
            }
        }
    }
    Py_XDECREF(stacked);
    for (auto& pair : named_subjects) {
        gsl_matrix_free(pair.second);
    }
    if (!ok) {
        return NULL;
    }
    PyObject *out = gsl_vector_to_np(f_peak);
    gsl_vector_free(f_peak);
    return out;
}

static PyMethodDef methods[] = {
    {"init_model", init_model, METH_VARARGS,
        "init_model(model_name, n_rois, params=None, config=None, SC=None, G=0.0)\n"
        "Creates the model of the session and builds its parameter table.\n\n"
        "Parameters:\n"
        "-----------\n"
        "model_name (str)\n"
            "\t'Deco2018' or 'Naskar2021'\n"
        "n_rois (int)\n"
            "\tnumber of regions\n"
        "params (dict)\n"
            "\tparameter values, float or np.ndarray (n_rois,)\n"
        "config (dict)\n"
            "\tmodel configurations with string keys and values\n"
            "\te.g. {'auto_fic': '1', 'fic_method': 'demirtas2019'}\n"
        "SC (np.ndarray) (n_rois, n_rois)\n"
            "\tstructural connectivity (source, target), used by FIC\n"
        "G (float)\n"
            "\tglobal coupling, used by FIC\n"
    },
    {"initial_state", initial_state, METH_NOARGS,
        "initial_state()\n"
        "Returns the initial state (n_state_vars, n_rois)"
    },
    {"initial_observed", initial_observed, METH_NOARGS,
        "initial_observed()\n"
        "Returns the initial observables (n_observable_vars, n_rois)"
    },
    {"get_param_table", get_param_table, METH_NOARGS,
        "get_param_table()\n"
        "Returns the parameter table (n_params, n_rois)"
    },
    {"dfun", dfun, METH_VARARGS,
        "dfun(state, coupling)\n"
        "Evaluates the model dynamics.\n\n"
        "Parameters:\n"
        "-----------\n"
        "state (np.ndarray) (n_state_vars, n_rois)\n"
        "coupling (np.ndarray) (n_coupling_vars, n_rois)\n\n"
        "Returns:\n"
        "--------\n"
        "dstate (np.ndarray) (n_state_vars, n_rois)\n"
        "observed (np.ndarray) (n_observable_vars, n_rois)\n"
    },
    {"filt_pow_spectra", filt_pow_spectra, METH_VARARGS,
        "filt_pow_spectra(signal, TR, filter_config=None)\n"
        "Power spectra of the band-pass filtered signal.\n\n"
        "Parameters:\n"
        "-----------\n"
        "signal (np.ndarray) (n_rois, time)\n"
        "TR (float)\n"
            "\tsampling interval (s)\n"
        "filter_config (dict)\n"
            "\tband-pass filter configurations (flp, fhi, k, demean,\n"
            "\tdetrend, remove_artefacts) with string values\n\n"
        "Returns:\n"
        "--------\n"
        "pow_spect (np.ndarray) (time//2, n_rois)\n"
    },
    {"filt_pow_spectra_multiple_subjects", filt_pow_spectra_multiple_subjects, METH_VARARGS,
        "filt_pow_spectra_multiple_subjects(signal, TR, filter_config=None, sigma=0.01)\n"
        "Frequency of maximal power of the subject-averaged and smoothed\n"
        "power spectra in each region.\n\n"
        "Parameters:\n"
        "-----------\n"
        "signal (dict | np.ndarray)\n"
            "\tdict of (n_rois, time) arrays, an (n_rois, time) array\n"
            "\tor an (n_subjects, n_rois, time) array\n"
        "TR (float)\n"
            "\tsampling interval (s)\n"
        "filter_config (dict)\n"
        "sigma (float)\n"
            "\twidth of the Gaussian smoothing (Hz)\n\n"
        "Returns:\n"
        "--------\n"
        "f_peak (np.ndarray) (n_rois,)\n"
    },
    {NULL, NULL, 0, NULL}
};

static struct PyModuleDef coreModule = {
    PyModuleDef_HEAD_INIT, "core",
    "core", -1, methods
};

PyMODINIT_FUNC PyInit_core(void) {
    import_array();
    return PyModule_Create(&coreModule);
}
