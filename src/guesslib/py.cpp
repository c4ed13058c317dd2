#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include "feedback.h"
#include "guess_refiner.h"
#include "guess_game.h"
#include "initial_guess.h"

namespace py = pybind11;

PYBIND11_MODULE(pyguesslib, m)
{
    m.doc() = "card guessing Python plugin";

    py::class_<feedback_t>(m, "Feedback")
        .def(py::init<>())
        .def_readwrite("correct_cards", &feedback_t::correct_cards)
        .def_readwrite("lower_ranks", &feedback_t::lower_ranks)
        .def_readwrite("correct_ranks", &feedback_t::correct_ranks)
        .def_readwrite("higher_ranks", &feedback_t::higher_ranks)
        .def_readwrite("correct_suits", &feedback_t::correct_suits)
        .def(py::self == py::self)
        .def("__repr__", &feedback_t::to_string)
        ;

    py::class_<game_state>(m, "GameState")
        .def_readonly("guess", &game_state::guess)
        .def_readonly("candidates", &game_state::candidates)
        ;

    py::class_<guess_game>(m, "GuessGame")
        .def(py::init<>())
        .def_property("max_guesses", &guess_game::get_max_guesses, &guess_game::set_max_guesses)
        .def("play", &guess_game::play)
        ;

    m.def("get_feedback", &get_feedback);
    m.def("initial_guess", &initial_guess);
    m.def("next_guess", &next_guess);
    m.def("get_expected_remaining", &get_expected_remaining);
    m.def("string_to_hand", &string_to_hand);
    m.def("get_hand_string", &get_hand_string);
}
